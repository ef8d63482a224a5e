#pragma once

int cmd_backfill(int argc, char** argv);
