#pragma once

int cmd_design(int argc, char** argv);
