#include "scoped_work_dir.h"
#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>

ScopedWorkDir::ScopedWorkDir(const std::string& prefix) {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    const auto base = std::filesystem::temp_directory_path();

    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / (prefix + "-" + std::to_string(rng()));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            path_ = candidate;
            return;
        }
        if (ec) {
            throw std::runtime_error("Could not create work directory " +
                candidate.string() + ": " + ec.message());
        }
    }

    throw std::runtime_error("Could not create a unique work directory under " + base.string());
}

ScopedWorkDir::~ScopedWorkDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove work directory " << path_.string()
            << ": " << ec.message() << std::endl;
    }
}

void ScopedWorkDir::publish(const std::filesystem::path& staged, const std::filesystem::path& destination) {
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path());
    }

    std::error_code ec;
    std::filesystem::rename(staged, destination, ec);
    if (!ec) {
        return;
    }

    // rename fails across file systems
    std::filesystem::copy_file(staged, destination,
        std::filesystem::copy_options::overwrite_existing);
    std::filesystem::remove(staged);
}
