#pragma once

int cmd_sources(int argc, char** argv);
