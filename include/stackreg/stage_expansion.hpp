#pragma once

#include "stackreg/types.hpp"
#include "stackreg/warnings.hpp"

#include <string>
#include <vector>

namespace stackreg {

// ============================================================================
// Stage Expansion
// ============================================================================

// Non-empty and made only of [A-Za-z0-9_-]
bool is_valid_stage_name(const std::string& stage);

// Instance id for a stage: "<stack-name>-<stage>"
std::string stage_instance_id(const std::string& stack_name, const std::string& stage);

// Region first, then stack props on top
StackProps merge_props(const UniversalProps& universal, const StackProps& props);

/**
 * Plan the instances of one eligible descriptor.
 *
 * A non-bootstrap descriptor with at least one valid stage yields one
 * instance per valid stage and no default instance. Invalid stage entries
 * are skipped and reported as stage_invalid. Every other descriptor yields
 * exactly one instance named after the stack.
 */
std::vector<StackInstance> expand_stack(const StackDescriptor& stack,
                                        const UniversalProps& universal,
                                        WarningCollector& warnings);

} // namespace stackreg
