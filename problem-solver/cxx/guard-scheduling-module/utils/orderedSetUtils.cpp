#include "orderedSetUtils.hpp"
#include "keynodes/guard-scheduling-keynodes.hpp"

OrderedSetBuilder::OrderedSetBuilder(ScMemoryContext & context, ScAddr const & set)
  : m_context(context)
  , m_set(set)
{
}

ScAddr OrderedSetBuilder::Append(ScAddr const & element)
{
  ScAddr const arc = m_context.GenerateConnector(ScType::ConstPermPosArc, m_set, element);
  if (!m_lastArc.IsValid())
  {
    m_context.GenerateConnector(ScType::ConstPermPosArc, ScKeynodes::rrel_1, arc);
  }
  else
  {
    ScAddr const sequenceArc = m_context.GenerateConnector(ScType::ConstCommonArc, m_lastArc, arc);
    m_context.GenerateConnector(ScType::ConstPermPosArc, GuardSchedulingKeynodes::nrel_basic_sequence, sequenceArc);
  }
  m_lastArc = arc;
  return arc;
}

std::vector<ScAddr> OrderedSetUtils::GetElements(ScMemoryContext & context, ScAddr const & set)
{
  std::vector<ScAddr> elements;

  size_t memberCount = 0;
  ScIterator3Ptr itMembers = context.CreateIterator3(set, ScType::ConstPermPosArc, ScType::Unknown);
  while (itMembers->Next())
    memberCount++;

  if (memberCount == 0)
    return elements;

  ScIterator5Ptr itFirst = context.CreateIterator5(
      set, ScType::ConstPermPosArc, ScType::Unknown, ScType::ConstPermPosArc, ScKeynodes::rrel_1);
  if (!itFirst->Next())
    SC_THROW_EXCEPTION(utils::ExceptionInvalidState, "Ordered set has no element marked with rrel_1");

  ScAddr arc = itFirst->Get(1);
  elements.push_back(itFirst->Get(2));

  // Не больше memberCount шагов, даже если последовательность зациклена
  while (elements.size() < memberCount)
  {
    ScIterator5Ptr itNext = context.CreateIterator5(
        arc,
        ScType::ConstCommonArc,
        ScType::ConstPermPosArc,
        ScType::ConstPermPosArc,
        GuardSchedulingKeynodes::nrel_basic_sequence);
    if (!itNext->Next())
      break;

    arc = itNext->Get(2);
    elements.push_back(context.GetArcTargetElement(arc));
  }

  if (elements.size() != memberCount)
    SC_THROW_EXCEPTION(
        utils::ExceptionInvalidState,
        "Ordered set sequence covers " << elements.size() << " of " << memberCount << " elements");

  return elements;
}
