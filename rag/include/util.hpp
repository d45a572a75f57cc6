#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

std::string getenv_or(const char* key, const std::string& def);
long getenv_long(const char* key, long def);
double getenv_double(const char* key, double def);
bool getenv_bool(const char* key, bool def);

std::string sha256_hex(const std::string& bytes);
std::string gen_id();
int64_t unix_millis();

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs);
std::string read_binary_file(const std::filesystem::path& p);
// Replaces p atomically: writes p.tmp then renames over p.
void write_file_atomic(const std::filesystem::path& p, const std::string& data);

std::string to_lower(std::string s);
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
