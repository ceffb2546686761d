#pragma once

#include <sc-memory/sc_addr.hpp>
#include <sc-memory/sc_keynodes.hpp>

class GuardSchedulingKeynodes : public ScKeynodes
{
public:
  static inline ScKeynode const action_build_guard_schedule{
    "action_build_guard_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const action_import_schedule_request_from_json{
    "action_import_schedule_request_from_json", ScType::ConstNodeClass};
  static inline ScKeynode const action_validate_shift_time{
    "action_validate_shift_time", ScType::ConstNodeClass};
  static inline ScKeynode const action_get_scheduling_algorithm_info{
    "action_get_scheduling_algorithm_info", ScType::ConstNodeClass};

  // Request
  static inline ScKeynode const concept_guard_schedule_request{
    "concept_guard_schedule_request", ScType::ConstNodeClass};
  static inline ScKeynode const concept_guard{"concept_guard", ScType::ConstNodeClass};
  static inline ScKeynode const concept_guard_post{"concept_guard_post", ScType::ConstNodeClass};
  static inline ScKeynode const concept_unavailability_window{
    "concept_unavailability_window", ScType::ConstNodeClass};

  static inline ScKeynode const nrel_schedule_start{"nrel_schedule_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_schedule_end{"nrel_schedule_end", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_guard_roster{"nrel_guard_roster", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_guard_posts{"nrel_guard_posts", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unavailability{"nrel_unavailability", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unavailable_guard{"nrel_unavailable_guard", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_window_start{"nrel_window_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_window_end{"nrel_window_end", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_day_shift_hours{"nrel_day_shift_hours", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_night_shift_hours{"nrel_night_shift_hours", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_night_time_start{"nrel_night_time_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_night_time_end{"nrel_night_time_end", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_max_consecutive_nights{
    "nrel_max_consecutive_nights", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_file_content{"nrel_file_content", ScType::ConstNodeNonRole};

  // Упорядоченные множества
  static inline ScKeynode const nrel_basic_sequence{"nrel_basic_sequence", ScType::ConstNodeNonRole};

  // Schedule structure
  static inline ScKeynode const concept_guard_schedule{"concept_guard_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const concept_guard_shift_assignment{
    "concept_guard_shift_assignment", ScType::ConstNodeClass};
  static inline ScKeynode const concept_night_shift{"concept_night_shift", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_schedule_assignments{
    "nrel_schedule_assignments", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_assigned_guard{"nrel_assigned_guard", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_assigned_post{"nrel_assigned_post", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_shift_start{"nrel_shift_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_shift_end{"nrel_shift_end", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_json_representation{
    "nrel_json_representation", ScType::ConstNodeNonRole};

  // Metadata
  static inline ScKeynode const nrel_total_assignments{"nrel_total_assignments", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unique_guards{"nrel_unique_guards", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unique_posts{"nrel_unique_posts", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_schedule_duration_hours{
    "nrel_schedule_duration_hours", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_workload{"nrel_workload", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_night_workload{"nrel_night_workload", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_worked_hours{"nrel_worked_hours", ScType::ConstNodeNonRole};

  // Failures
  static inline ScKeynode const concept_guard_schedule_failure{
    "concept_guard_schedule_failure", ScType::ConstNodeClass};
  static inline ScKeynode const concept_invalid_schedule_request{
    "concept_invalid_schedule_request", ScType::ConstNodeClass};
  static inline ScKeynode const concept_invalid_horizon{"concept_invalid_horizon", ScType::ConstNodeClass};
  static inline ScKeynode const concept_empty_roster{"concept_empty_roster", ScType::ConstNodeClass};
  static inline ScKeynode const concept_unfillable_slot{"concept_unfillable_slot", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_failure_reason{"nrel_failure_reason", ScType::ConstNodeNonRole};

  // Проверка времени смены
  static inline ScKeynode const concept_valid_shift_time{"concept_valid_shift_time", ScType::ConstNodeClass};
  static inline ScKeynode const concept_invalid_shift_time{
    "concept_invalid_shift_time", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_closest_valid_time{"nrel_closest_valid_time", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_validation_message{"nrel_validation_message", ScType::ConstNodeNonRole};

  // Описание алгоритма
  static inline ScKeynode const concept_scheduling_algorithm_info{
    "concept_scheduling_algorithm_info", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_algorithm_name{"nrel_algorithm_name", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_algorithm_description{
    "nrel_algorithm_description", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_algorithm_features{"nrel_algorithm_features", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_algorithm_constraints{
    "nrel_algorithm_constraints", ScType::ConstNodeNonRole};
};
