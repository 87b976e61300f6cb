#pragma once

#include "file_processor.hpp"

#include <iosfwd>

// Each returns the process exit status.

int runBatch(UniqueIntProcessor& processor, const fs::path& input_dir, const fs::path& output_dir);

int runSingle(UniqueIntProcessor& processor, const fs::path& input_path, const fs::path& output_path);

// Prompts on out for the input and output paths, read line by line from in.
int runInteractive(UniqueIntProcessor& processor, std::istream& in, std::ostream& out);
