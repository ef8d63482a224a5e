#pragma once

int cmd_flatten(int argc, char** argv);
