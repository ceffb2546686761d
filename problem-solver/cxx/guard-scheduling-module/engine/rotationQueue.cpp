#include "rotationQueue.hpp"

#include <sc-memory/sc_utils.hpp>

#include <algorithm>

RotationQueue::RotationQueue(std::vector<std::string> const & guards)
  : m_guards(guards.begin(), guards.end())
{
}

std::string const & RotationQueue::PeekFrom(size_t offset) const
{
  if (offset >= m_guards.size())
    SC_THROW_EXCEPTION(
        utils::ExceptionInvalidParams,
        "Rotation offset " << offset << " is out of queue of size " << m_guards.size());

  return m_guards[offset];
}

void RotationQueue::Commit(std::string const & guard)
{
  auto const it = std::find(m_guards.begin(), m_guards.end(), guard);
  if (it == m_guards.end())
    SC_THROW_EXCEPTION(utils::ExceptionItemNotFound, "Guard `" << guard << "` is not in rotation queue");

  std::string committed = *it;
  m_guards.erase(it);
  m_guards.push_back(std::move(committed));
}

size_t RotationQueue::Size() const
{
  return m_guards.size();
}

std::vector<std::string> RotationQueue::GetOrder() const
{
  return {m_guards.begin(), m_guards.end()};
}
