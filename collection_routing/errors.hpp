#pragma once
#include <stdexcept>
#include <string>

enum class InputErrorKind {
    EmptyDemand,
    NoActiveVehicles,
    DuplicateDemandId,
    DuplicateVehicleId
};

const char *input_error_name(InputErrorKind kind);

// Fatal to the whole optimization run.
class InputError : public std::runtime_error {
public:
    InputError(InputErrorKind kind, const std::string &reason)
        : std::runtime_error(reason), kind_(kind) {}

    InputErrorKind kind() const { return kind_; }

private:
    InputErrorKind kind_;
};

// Per vehicle: capacity_per_trip <= 0.
class CapacityError : public std::runtime_error {
public:
    CapacityError(const std::string &vehicle_id, int capacity)
        : std::runtime_error("vehicle " + vehicle_id + " has non-positive capacity "
                             + std::to_string(capacity)),
          vehicle_id_(vehicle_id), capacity_(capacity) {}

    const std::string &vehicle_id() const { return vehicle_id_; }
    int capacity() const { return capacity_; }

private:
    std::string vehicle_id_;
    int capacity_;
};

// Per road feature part: empty or degenerate line.
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class IssueKind {
    Geometry,
    Capacity,
    Graph
};

const char *issue_kind_name(IssueKind kind);

// A non-fatal condition absorbed by a stage and kept in the result.
struct Issue {
    IssueKind kind;
    std::string subject;
    std::string reason;
};
