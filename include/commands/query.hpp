#pragma once

int cmd_query(int argc, char** argv);
