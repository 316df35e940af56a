#pragma once

#include <stdexcept>
#include <string>

// Missing or malformed settings; fatal before any network activity.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// SQLite open, migrate or write failure.
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed zip, extraction or deletion failure.
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};
