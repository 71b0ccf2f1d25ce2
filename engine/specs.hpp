#pragma once
#include <array>
#include "types.hpp"

namespace peril {

struct ServiceSpec {
    int cpu_cost;
    int memory_cost;
    int storage_cost;
    int capacity;      // max sustainable load
    int base_latency;  // informational only
};

inline constexpr std::array<ServiceSpec, to_index(ServiceKind::COUNT)> SPEC {{
    /* Compute      */ ServiceSpec{ /*cpu*/2, /*mem*/2, /*storage*/1, /*capacity*/5,  /*latency*/10 },
    /* Database     */ ServiceSpec{ 1, 2, 3, 3,  50 },
    /* Cache        */ ServiceSpec{ 1, 3, 1, 8,  5 },
    /* Queue        */ ServiceSpec{ 1, 1, 2, 6,  15 },
    /* LoadBalancer */ ServiceSpec{ 2, 1, 1, 10, 8 },
    /* ApiGateway   */ ServiceSpec{ 1, 1, 1, 7,  12 },
}};

inline constexpr std::array<ServiceKind, to_index(ServiceKind::COUNT)> ALL_SERVICE_KINDS {{
    ServiceKind::Compute, ServiceKind::Database, ServiceKind::Cache,
    ServiceKind::Queue, ServiceKind::LoadBalancer, ServiceKind::ApiGateway,
}};

inline const ServiceSpec& getSpec(ServiceKind k) {
    return SPEC[to_index(k)]; // avoids map lookups/at() throws
}

// Kinds that forward traffic downstream instead of completing it.
constexpr bool isRouter(ServiceKind k) {
    return k == ServiceKind::LoadBalancer || k == ServiceKind::ApiGateway;
}

} // namespace peril
