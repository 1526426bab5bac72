#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::python = "python3";
std::string Flags::temp_directory = "/tmp/codecheck";
bool Flags::keep_sandboxes = false;
int64_t Flags::memory_limit_kb = 512 * 1024;

int64_t Flags::timeout_millis = 5000;
int64_t Flags::suite_timeout_millis = 60000;
bool Flags::stop_on_first_failure = false;

bool Flags::json = false;
