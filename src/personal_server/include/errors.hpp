#pragma once
#include <stdexcept>
#include <string>

// Raised when a record or artifact cannot be written. Routes map it to 500.
struct StorageError : std::runtime_error {
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when a page cannot be fetched. Routes map it to 502.
struct ScrapeError : std::runtime_error {
    explicit ScrapeError(const std::string& what) : std::runtime_error(what) {}
};
