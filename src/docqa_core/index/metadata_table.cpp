#include "docqa_core/index/metadata_table.hpp"

#include <algorithm>
#include <iterator>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

std::vector<int64_t> intersect(const std::vector<int64_t> &a, const std::vector<int64_t> &b) {
  std::vector<int64_t> out;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
  return out;
}

}  // namespace

MetadataTable::MetadataTable(std::vector<Chunk> rows) : rows_(std::move(rows)) {
  for (size_t i = 0; i < rows_.size(); ++i) {
    const auto id = static_cast<int64_t>(i);
    const Chunk &row = rows_[i];
    by_source_[row.source].push_back(id);
    if (row.page) {
      by_page_[*row.page].push_back(id);
    }
    if (row.clause_number) {
      by_clause_[trim(*row.clause_number)].push_back(id);
    }
  }
}

std::string MetadataTable::trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

const Chunk &MetadataTable::at(int64_t id) const {
  if (id < 0 || id >= static_cast<int64_t>(rows_.size())) {
    throw NotFoundError("Chunk id " + std::to_string(id) + " is not in the metadata table");
  }
  return rows_[id];
}

bool MetadataTable::matches(int64_t id, const RetrievalFilter &filter) const {
  const Chunk &row = at(id);
  if (filter.source && row.source != *filter.source) {
    return false;
  }
  if (filter.page_from || filter.page_to) {
    if (!row.page) {
      return false;
    }
    if (filter.page_from && *row.page < *filter.page_from) {
      return false;
    }
    if (filter.page_to && *row.page > *filter.page_to) {
      return false;
    }
  }
  if (filter.clause_number) {
    if (!row.clause_number || trim(*row.clause_number) != trim(*filter.clause_number)) {
      return false;
    }
  }
  return true;
}

std::vector<int64_t> MetadataTable::allowed_ids(const RetrievalFilter &filter) const {
  std::optional<std::vector<int64_t>> result;
  auto narrow = [&result](std::vector<int64_t> ids) {
    result = result ? intersect(*result, ids) : std::move(ids);
  };

  if (filter.source) {
    auto it = by_source_.find(*filter.source);
    narrow(it == by_source_.end() ? std::vector<int64_t>{} : it->second);
  }

  if (filter.page_from || filter.page_to) {
    auto first = filter.page_from ? by_page_.lower_bound(*filter.page_from) : by_page_.begin();
    auto last = filter.page_to ? by_page_.upper_bound(*filter.page_to) : by_page_.end();
    std::vector<int64_t> ids;
    if (!filter.page_from || !filter.page_to || *filter.page_from <= *filter.page_to) {
      for (auto it = first; it != last; ++it) {
        ids.insert(ids.end(), it->second.begin(), it->second.end());
      }
      std::sort(ids.begin(), ids.end());
    }
    narrow(std::move(ids));
  }

  if (filter.clause_number) {
    auto it = by_clause_.find(trim(*filter.clause_number));
    narrow(it == by_clause_.end() ? std::vector<int64_t>{} : it->second);
  }

  if (!result) {
    std::vector<int64_t> all(rows_.size());
    for (size_t i = 0; i < all.size(); ++i) {
      all[i] = static_cast<int64_t>(i);
    }
    return all;
  }
  return *result;
}

}  // namespace docqa_core
