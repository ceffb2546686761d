#pragma once

#include <deque>
#include <string>
#include <vector>

// Очередь ротации охранников одного поста. Назначенный охранник
// переносится в конец, поэтому каждый охранник всегда присутствует ровно один раз.
class RotationQueue
{
public:
  explicit RotationQueue(std::vector<std::string> const & guards);

  std::string const & PeekFrom(size_t offset) const;
  void Commit(std::string const & guard);

  size_t Size() const;
  std::vector<std::string> GetOrder() const;

private:
  std::deque<std::string> m_guards;
};
