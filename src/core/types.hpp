/**
 * @file types.hpp
 * @brief Fundamental types used throughout NodeOrder.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, TaskId, Resources, Task, Node, and other shared vocabulary
 * types. All types are designed for value semantics.
 */

#pragma once

#include "core/affinity.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace node_order {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using TaskId = std::string;

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

/// Requests below this are rounded up when ranking nodes.
inline constexpr int64_t kDefaultMilliCpuRequest = 100;
inline constexpr int64_t kDefaultMemoryRequest = 200LL * 1024 * 1024;

/**
 * @brief A resource vector: compute in milli-CPU, memory in bytes.
 */
struct Resources {
    int64_t milli_cpu{0};
    int64_t memory_bytes{0};

    constexpr Resources& operator+=(const Resources& other) noexcept {
        milli_cpu += other.milli_cpu;
        memory_bytes += other.memory_bytes;
        return *this;
    }

    constexpr Resources& operator-=(const Resources& other) noexcept {
        milli_cpu -= other.milli_cpu;
        memory_bytes -= other.memory_bytes;
        return *this;
    }

    [[nodiscard]] constexpr Resources operator+(const Resources& other) const noexcept {
        Resources sum = *this;
        sum += other;
        return sum;
    }

    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return milli_cpu == 0 && memory_bytes == 0;
    }

    /// Request with zero dimensions replaced by the scheduler defaults.
    [[nodiscard]] constexpr Resources non_zero() const noexcept {
        return Resources{
            .milli_cpu = milli_cpu != 0 ? milli_cpu : kDefaultMilliCpuRequest,
            .memory_bytes = memory_bytes != 0 ? memory_bytes : kDefaultMemoryRequest
        };
    }

    bool operator==(const Resources&) const = default;
};

// ─────────────────────────────────────────────
// Task & Node
// ─────────────────────────────────────────────

/**
 * @brief A schedulable unit of work.
 *
 * `assigned_node` is empty while the task is unbound.
 */
struct Task {
    TaskId uid;
    std::string name;
    std::string namespace_name = "default";
    Labels labels;
    Resources request;
    Affinity affinity;
    NodeId assigned_node;

    [[nodiscard]] bool is_bound() const noexcept { return !assigned_node.empty(); }
    [[nodiscard]] std::string qualified_name() const { return namespace_name + "/" + name; }
};

/**
 * @brief A placement target with finite allocatable capacity.
 */
struct Node {
    NodeId name;
    Labels labels;
    Resources allocatable;
};

/// Well-known label carrying the node name, used as the default topology key.
inline constexpr std::string_view kHostnameLabel = "kubernetes.io/hostname";

}  // namespace node_order
