#pragma once

// docsim analyze: whole-document similarity matrix
int cmd_analyze(int argc, char** argv);
