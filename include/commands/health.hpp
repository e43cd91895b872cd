#pragma once

int cmd_health(int argc, char** argv);
