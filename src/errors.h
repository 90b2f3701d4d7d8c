#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace schsync {

class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& what) : std::runtime_error(what) {}
};

// A component record is missing a required field
class InvalidComponentError : public SyncError {
public:
    explicit InvalidComponentError(const std::string& what) : SyncError(what) {}
};

// A destination sheet fragment cannot be reconciled (missing/duplicate ids, bad records)
class SnapshotError : public SyncError {
public:
    SnapshotError(const std::string& sheet, const std::string& what)
        : SyncError(sheet.empty() ? what : "sheet '" + sheet + "': " + what)
        , sheet_(sheet) {}

    const std::string& sheet() const { return sheet_; }

private:
    std::string sheet_;
};

// Malformed sheet hierarchy: cycles, unknown parents, nets without a common ancestor
class StructuralError : public SyncError {
public:
    StructuralError(const std::string& what, std::vector<std::string> sheets = {})
        : SyncError(what), sheets_(std::move(sheets)) {}

    const std::vector<std::string>& sheets() const { return sheets_; }

private:
    std::vector<std::string> sheets_;
};

} // namespace schsync
