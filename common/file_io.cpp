// ============================================================
// file_io.cpp -- Small-file helpers implementation
// ============================================================

#include "file_io.hpp"
#include <fstream>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::vector<u8> file_io::read_small_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    f.seekg(0, std::ios::end);
    std::streamoff end = f.tellg();
    if (end < 0) {
        throw std::runtime_error("Cannot determine size of file: " + path);
    }
    f.seekg(0, std::ios::beg);
    std::vector<u8> buf((size_t)end);
    if (!buf.empty() && !f.read((char*)buf.data(), (std::streamsize)buf.size())) {
        throw std::runtime_error("Short read on file: " + path);
    }
    return buf;
}

std::string file_io::write_part_file(const std::string& path, const std::vector<u8>& data) {
    ensure_parent_dirs(path);
    std::string tmp = path + ".part";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            throw std::runtime_error("Cannot create file: " + tmp);
        }
        if (!data.empty()) {
            f.write((const char*)data.data(), (std::streamsize)data.size());
        }
        f.flush();
        if (!f) {
            std::remove(tmp.c_str());
            throw std::runtime_error("Write failed: " + tmp);
        }
    }
    return tmp;
}

void file_io::commit_part_file(const std::string& part_path, const std::string& path) {
    std::error_code ec;
    fs::rename(part_path, path, ec);
    if (ec) {
        std::remove(part_path.c_str());
        throw std::runtime_error("Cannot move " + part_path + " to " + path + ": " + ec.message());
    }
}

void file_io::discard_part_file(const std::string& part_path) {
    std::error_code ec;
    fs::remove(part_path, ec);
}
