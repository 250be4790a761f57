#pragma once

int cmd_segment(int argc, char** argv);
