#pragma once

#include <sc-memory/sc_module.hpp>

class GuardSchedulingModule : public ScModule
{
};
