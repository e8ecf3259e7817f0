#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace analysis::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  auto& s       = TX(t).Mutable();
  auto& channel = s.tasks[r.channel];
  if (channel.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists);
  r.seq                = s.next_seq++;
  channel[r.task_id]   = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& channel, const std::string& task_id) {
  const auto& s  = TX(t).View();
  const auto  ch = s.tasks.find(channel);
  if (ch == s.tasks.end()) return std::nullopt;
  const auto it = ch->second.find(task_id);
  if (it == ch->second.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t, const std::string& channel) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> out;
  const auto                     ch = s.tasks.find(channel);
  if (ch == s.tasks.end()) return out;

  out.reserve(ch->second.size());
  for (const auto& [_, record] : ch->second) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return out;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  ch = s.tasks.find(r.channel);
  if (ch == s.tasks.end() || !ch->second.contains(r.task_id)) return Result::Err(ErrorCode::NotFound);
  ch->second[r.task_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& channel, const std::string& task_id) {
  auto& s  = TX(t).Mutable();
  auto  ch = s.tasks.find(channel);
  if (ch == s.tasks.end() || ch->second.erase(task_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result MemoryRepository::InsertResult(Transaction& t, const model::ResultRow& r) {
  auto& channel = TX(t).Mutable().results[r.channel];
  if (channel.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists);
  channel[r.task_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateResult(Transaction& t, const model::ResultRow& r) {
  auto& s  = TX(t).Mutable();
  auto  ch = s.results.find(r.channel);
  if (ch == s.results.end() || !ch->second.contains(r.task_id)) return Result::Err(ErrorCode::NotFound);
  ch->second[r.task_id] = r;
  return Result::Ok();
}

std::optional<model::ResultRow> MemoryRepository::GetResult(Transaction& t, const std::string& channel, const std::string& task_id) {
  const auto& s  = TX(t).View();
  const auto  ch = s.results.find(channel);
  if (ch == s.results.end()) return std::nullopt;
  const auto it = ch->second.find(task_id);
  if (it == ch->second.end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::CountResults(Transaction& t, const std::string& channel) {
  const auto& s  = TX(t).View();
  const auto  ch = s.results.find(channel);
  return ch == s.results.end() ? 0 : ch->second.size();
}

} // namespace analysis::db::memory
