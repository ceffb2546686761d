#include "guardSchedulingModule.hpp"

#include "agents/buildGuardScheduleAgent.hpp"
#include "agents/getAlgorithmInfoAgent.hpp"
#include "agents/importScheduleRequestAgent.hpp"
#include "agents/validateShiftTimeAgent.hpp"

SC_MODULE_REGISTER(GuardSchedulingModule)
    ->Agent<BuildGuardScheduleAgent>()
    ->Agent<ImportScheduleRequestAgent>()
    ->Agent<ValidateShiftTimeAgent>()
    ->Agent<GetAlgorithmInfoAgent>();
