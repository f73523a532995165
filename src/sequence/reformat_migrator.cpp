#include "mseq/sequence/reformat_migrator.h"

#include "mseq/sequence/template_codec.h"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mseq::sequence {

using domain::SequenceError;

namespace {

constexpr std::size_t kNone = static_cast<std::size_t>(-1);

}  // namespace

const char* reformat_outcome_name(const ReformatOutcome outcome) {
  switch (outcome) {
    case ReformatOutcome::kUpdated:
      return "updated";
    case ReformatOutcome::kUnchanged:
      return "unchanged";
    case ReformatOutcome::kUndecodable:
      return "undecodable";
    case ReformatOutcome::kFailed:
      return "failed";
  }
  return "failed";
}

ReformatMigrator::ReformatMigrator(const storage::ICategoryDirectory& categories,
                                   storage::IMachineRepository& machines)
    : categories_(categories), machines_(machines) {}

domain::SequenceResult<ReformatReport> ReformatMigrator::run(const ReformatRequest& request) {
  using R = domain::SequenceResult<ReformatReport>;

  auto new_template = SequenceTemplate::parse(request.new_format);
  if (!new_template.has_value()) {
    return R::err(new_template.error());
  }
  // Historical templates may predate today's grammar rules.
  const auto old_template = SequenceTemplate::parse_lenient(request.old_format);

  const auto category = categories_.get(request.scope.category_id);
  if (!category.has_value()) {
    return R::err({SequenceError::kReferenceNotFound,
                   "Category not found: " + request.scope.category_id.value});
  }

  std::string subcategory_slug;
  if (request.scope.subcategory_id.has_value()) {
    const auto subcategory = categories_.get(*request.scope.subcategory_id);
    if (!subcategory.has_value()) {
      return R::err({SequenceError::kReferenceNotFound,
                     "Subcategory not found: " + request.scope.subcategory_id->value});
    }
    subcategory_slug = subcategory->slug;
  }

  const SequenceDecoder decoder(old_template, {category->slug, subcategory_slug});

  ReformatReport report;
  report.dry_run = request.dry_run;

  // Phase 1: plan.
  const auto machines =
      machines_.list_live_by_scope(request.scope.category_id, request.scope.subcategory_id);
  report.items.reserve(machines.size());

  for (const auto& machine : machines) {
    ReformatItem item;
    item.machine_id = machine.machine_id;
    item.old_identifier = machine.identifier;

    const auto decoded = decoder.decode(machine.identifier);
    if (!decoded.has_value()) {
      item.outcome = ReformatOutcome::kUndecodable;
      item.reason = "No sequence number found in identifier";
      report.items.push_back(std::move(item));
      continue;
    }

    item.strategy = decoded->strategy;
    item.new_identifier =
        encode(new_template.value(), category->slug, subcategory_slug, decoded->number);
    item.outcome = *item.new_identifier == machine.identifier ? ReformatOutcome::kUnchanged
                                                               : ReformatOutcome::kUpdated;
    report.items.push_back(std::move(item));
  }

  auto& items = report.items;
  const std::size_t count = items.size();

  // Batch member currently holding each identifier. An identifier held by two
  // members is never treated as freed.
  std::map<std::string, std::size_t> holder;
  std::set<std::string> shared;
  for (std::size_t i = 0; i < count; ++i) {
    if (!holder.emplace(items[i].old_identifier, i).second) {
      shared.insert(items[i].old_identifier);
    }
  }
  for (const auto& identifier : shared) {
    holder.erase(identifier);
  }

  // The member that frees item i's target by moving away from it, or kNone.
  const auto vacator = [&](const std::size_t i) {
    const auto it = holder.find(*items[i].new_identifier);
    if (it == holder.end() || it->second == i ||
        items[it->second].outcome != ReformatOutcome::kUpdated) {
      return kNone;
    }
    return it->second;
  };

  std::map<std::string, bool> held_live;
  const auto is_held_live = [&](const std::string& identifier) {
    auto it = held_live.find(identifier);
    if (it == held_live.end()) {
      it = held_live.emplace(identifier, machines_.exists_live_with_identifier(identifier)).first;
    }
    return it->second;
  };

  const auto fail = [](ReformatItem& item, std::string reason) {
    item.outcome = ReformatOutcome::kFailed;
    item.reason = std::move(reason);
  };

  // Phase 2: collision check. A failed item keeps its identifier, which can
  // invalidate a target accepted earlier, so repeat until nothing changes.
  for (bool changed = true; changed;) {
    changed = false;

    std::map<std::string, std::size_t> claimed;
    for (std::size_t i = 0; i < count; ++i) {
      if (items[i].outcome != ReformatOutcome::kUpdated) {
        continue;
      }
      const std::string& target = *items[i].new_identifier;
      if (const auto it = claimed.find(target); it != claimed.end()) {
        fail(items[i], "Identifier " + target + " is also the target of machine " +
                           items[it->second].machine_id.value);
        changed = true;
      } else if (vacator(i) == kNone && is_held_live(target)) {
        fail(items[i], "Identifier " + target + " is already used by another machine");
        changed = true;
      } else {
        claimed.emplace(target, i);
      }
    }

    // Members that trade identifiers in a cycle have no write order that keeps
    // every identifier unique at each step.
    std::vector<std::size_t> cyclic;
    for (std::size_t i = 0; i < count; ++i) {
      if (items[i].outcome != ReformatOutcome::kUpdated) {
        continue;
      }
      std::size_t next = vacator(i);
      for (std::size_t steps = 0; next != kNone && next != i && steps < count; ++steps) {
        next = vacator(next);
      }
      if (next == i) {
        cyclic.push_back(i);
      }
    }
    for (const std::size_t i : cyclic) {
      fail(items[i], "Identifier " + *items[i].new_identifier +
                         " is exchanged in a cycle within the batch");
      changed = true;
    }
  }

  // Phase 3: apply. A machine that frees an identifier is written before the
  // machine taking it; if that write fails, the taker fails too.
  std::vector<std::size_t> planned_vacator(count, kNone);
  for (std::size_t i = 0; i < count; ++i) {
    if (items[i].outcome == ReformatOutcome::kUpdated) {
      planned_vacator[i] = vacator(i);
    }
  }

  std::vector<bool> applied(count, false);
  for (std::size_t start = 0; start < count; ++start) {
    std::vector<std::size_t> chain;
    for (std::size_t k = start; k != kNone && !applied[k] && chain.size() < count;
         k = planned_vacator[k]) {
      chain.push_back(k);
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      auto& item = items[*it];
      applied[*it] = true;
      if (item.outcome != ReformatOutcome::kUpdated) {
        continue;
      }
      if (const std::size_t j = planned_vacator[*it];
          j != kNone && items[j].outcome != ReformatOutcome::kUpdated) {
        fail(item, "Identifier " + *item.new_identifier + " is still held by machine " +
                       items[j].machine_id.value);
        continue;
      }
      if (request.dry_run) {
        continue;
      }
      auto written = machines_.set_identifier(item.machine_id, *item.new_identifier);
      if (!written.has_value()) {
        fail(item, written.error() == core::StorageError::kNotFound
                       ? "Machine no longer exists"
                       : "Machine identifier write failed");
      }
    }
  }

  for (const auto& item : items) {
    switch (item.outcome) {
      case ReformatOutcome::kUpdated:
        ++report.updated;
        break;
      case ReformatOutcome::kUnchanged:
        ++report.unchanged;
        break;
      case ReformatOutcome::kUndecodable:
        ++report.undecodable;
        break;
      case ReformatOutcome::kFailed:
        ++report.failed;
        break;
    }
  }

  return R::ok(std::move(report));
}

}  // namespace mseq::sequence
