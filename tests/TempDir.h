//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TempDir.h
// Purpose: Scratch directory removed at scope exit
//==========================================================================================================

#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace toolhost::testing {

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        dir = std::filesystem::temp_directory_path() /
              ("toolhost-test-" + std::to_string(::getpid()) + "-" + std::to_string(++counter));
        std::filesystem::create_directories(dir);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string File(const std::string& name) const { return (dir / name).string(); }
    const std::filesystem::path& Path() const { return dir; }

    std::string Write(const std::string& name, const std::string& content) const {
        const auto p = dir / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p.string();
    }

    std::string Read(const std::string& name) const {
        std::ifstream in(dir / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path dir;
};

} // namespace toolhost::testing
