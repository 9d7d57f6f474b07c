#pragma once
#include <string>

int cmd_sentences(const std::string& path);
