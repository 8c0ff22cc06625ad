#include "DigestLedger.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr int kJsonIndent = 4;
}

DigestLedger::DigestLedger(std::filesystem::path rootDir)
    : m_ledgerPath(std::move(rootDir) / kFileName) {}

std::string DigestLedger::makeKey(const std::string& destination, const std::string& finalFilename) {
    return destination + " | " + finalFilename;
}

bool DigestLedger::bootstrapIfAbsent() const {
    std::error_code ec;
    if (std::filesystem::exists(m_ledgerPath, ec)) {
        return true;
    }

    if (ec) {
        std::cerr << "Unable to check digest ledger `" << m_ledgerPath.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    std::ofstream out(m_ledgerPath, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to create digest ledger: " << m_ledgerPath << std::endl;
        return false;
    }

    out << json::object().dump();
    out.flush();
    if (!out) {
        std::cerr << "Failed to write digest ledger: " << m_ledgerPath << std::endl;
        return false;
    }
    return true;
}

bool DigestLedger::record(const std::string& destination, const std::string& finalFilename, const std::string& digestHex) {
    // Later moves with the same destination and name replace the earlier digest.
    m_entries[makeKey(destination, finalFilename)] = digestHex;

    if (!bootstrapIfAbsent()) {
        return false;
    }
    return writeEntries();
}

bool DigestLedger::writeEntries() const {
    std::ofstream out(m_ledgerPath, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open digest ledger for writing: " << m_ledgerPath << std::endl;
        return false;
    }

    const json data(m_entries);
    // Filenames that are not valid UTF-8 are written with replacement characters instead of throwing.
    out << data.dump(kJsonIndent, ' ', false, json::error_handler_t::replace);
    out.flush();
    if (!out) {
        std::cerr << "Failed to write digest ledger: " << m_ledgerPath << std::endl;
        return false;
    }
    return true;
}

std::optional<DigestLedger::Entries> DigestLedger::readFile(const std::filesystem::path& ledgerPath) {
    std::ifstream jsonFile(ledgerPath);
    if (!jsonFile) {
        std::cerr << "Failed to open digest ledger: " << ledgerPath << std::endl;
        return std::nullopt;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse digest ledger: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid digest ledger " << ledgerPath << ": expected an object." << std::endl;
        return std::nullopt;
    }

    Entries entries;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!it.value().is_string()) {
            std::cerr << "Invalid digest ledger entry `" << it.key() << "`: value must be a string." << std::endl;
            return std::nullopt;
        }
        entries.emplace(it.key(), it.value().get<std::string>());
    }
    return entries;
}
