#pragma once

int cmd_upsert(int argc, char** argv);
