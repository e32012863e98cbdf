#include "errors.hpp"

const char *input_error_name(InputErrorKind kind) {
    switch (kind) {
    case InputErrorKind::EmptyDemand: return "EmptyDemand";
    case InputErrorKind::NoActiveVehicles: return "NoActiveVehicles";
    case InputErrorKind::DuplicateDemandId: return "DuplicateDemandId";
    case InputErrorKind::DuplicateVehicleId: return "DuplicateVehicleId";
    }
    return "InputError";
}

const char *issue_kind_name(IssueKind kind) {
    switch (kind) {
    case IssueKind::Geometry: return "GeometryError";
    case IssueKind::Capacity: return "CapacityError";
    case IssueKind::Graph: return "GraphError";
    }
    return "Issue";
}
