#pragma once

#include <sc-memory/sc_memory.hpp>

#include <vector>

// Упорядоченное множество: первая дуга принадлежности отмечена rrel_1,
// соседние дуги связаны отношением nrel_basic_sequence.
class OrderedSetBuilder
{
public:
  OrderedSetBuilder(ScMemoryContext & context, ScAddr const & set);

  ScAddr Append(ScAddr const & element);

private:
  ScMemoryContext & m_context;
  ScAddr m_set;
  ScAddr m_lastArc;
};

class OrderedSetUtils
{
public:
  static std::vector<ScAddr> GetElements(ScMemoryContext & context, ScAddr const & set);
};
