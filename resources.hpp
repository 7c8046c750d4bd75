#pragma once
#include <string>

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------

// Resource root: <project>/resources, else ./resources, else cwd
std::string getResourcePath();

// <resource root>/<relative>
std::string resourceFile(const std::string& relative);
