#pragma once

#include "constraintChecker.hpp"
#include "guardStateTable.hpp"
#include "rotationQueue.hpp"
#include "scheduleTypes.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Распределение охранников по постам на основе очередей ротации.
// Всё промежуточное состояние создаётся заново при каждом вызове Assemble.
class AssignmentAssembler
{
public:
  explicit AssignmentAssembler(ScheduleRequest request);

  ScheduleResult Assemble() const;

  // Проверяет запрос целиком до распределения
  static std::optional<ScheduleError> ValidateRequest(ScheduleRequest const & request);

private:
  std::optional<ScheduleError> AssignPost(
      std::string const & post,
      RotationQueue & queue,
      GuardStateTable & states,
      ConstraintChecker const & checker,
      std::vector<Assignment> & assignments) const;

  ScheduleError MakeUnfillableSlotError(
      ShiftSlot const & slot,
      RotationQueue const & queue,
      GuardStateTable const & states,
      ConstraintChecker const & checker) const;

  ScheduleMetadata BuildMetadata(std::vector<Assignment> const & assignments) const;

  static ScheduleResult Fail(ScheduleError error);

  ScheduleRequest m_request;
};

std::string GetErrorKindName(ScheduleErrorKind kind);

// Пары индексов назначений одного охранника на разных постах с пересекающимся временем
std::vector<std::pair<size_t, size_t>> FindOverlappingAssignments(std::vector<Assignment> const & assignments);
