#pragma once

int run_atlasfix(int argc, char** argv);
int run_stextool(int argc, char** argv);
