#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <unordered_set>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stol(v);
    } catch (const std::exception&) {
        throw ValidationError(std::string("invalid integer in ") + key + ": " + v);
    }
}

double getenv_double(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        throw ValidationError(std::string("invalid number in ") + key + ": " + v);
    }
}

bool getenv_bool(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    auto s = to_lower(v);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

std::string sha256_hex(const std::string& bytes) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string gen_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

int64_t unix_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs) {
    std::vector<std::filesystem::path> out;
    auto extset = std::unordered_set<std::string>(exts.begin(), exts.end());
    auto igset = std::unordered_set<std::string>(ignore_dirs.begin(), ignore_dirs.end());
    for (auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto rel = std::filesystem::relative(entry.path(), root);
        bool ignored = false;
        for (auto& part : rel) {
            if (igset.count(part.string())) { ignored = true; break; }
        }
        if (ignored) continue;
        auto ext = to_lower(entry.path().extension().string());
        if (extset.empty() || extset.count(ext)) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string read_binary_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file_atomic(const std::filesystem::path& p, const std::string& data) {
    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw StoreError("cannot write " + tmp.string());
        f.write(data.data(), (std::streamsize)data.size());
        f.flush();
        if (!f) throw StoreError("short write to " + tmp.string());
    }
    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) throw StoreError("rename " + tmp.string() + " failed: " + ec.message());
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}
