#pragma once

// docsim compare: sentence-level cross-document matching
int cmd_compare(int argc, char** argv);
