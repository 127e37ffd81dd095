#include "harvest_report.hpp"
#include "yyjson_guard.hpp"

#include "duckdb.hpp"

#include <set>

namespace harvester {

//===--------------------------------------------------------------------===//
// Entry status
//===--------------------------------------------------------------------===//

const char *EntryStatusToString(EntryStatus status) {
	switch (status) {
		case EntryStatus::SUCCEEDED: return "succeeded";
		case EntryStatus::FETCH_FAILED: return "fetch_failed";
		case EntryStatus::EXTRACTION_FAILED: return "extraction_failed";
		case EntryStatus::INCOMPLETE: return "incomplete";
		default: return "unknown";
	}
}

EntryStatus EntryStatusFromString(const std::string &name) {
	static const EntryStatus all_statuses[] = {EntryStatus::SUCCEEDED, EntryStatus::FETCH_FAILED,
	                                           EntryStatus::EXTRACTION_FAILED, EntryStatus::INCOMPLETE};
	for (auto status : all_statuses) {
		if (name == EntryStatusToString(status)) {
			return status;
		}
	}
	throw duckdb::InvalidInputException("unknown entry status '" + name + "'");
}

//===--------------------------------------------------------------------===//
// HarvestReport
//===--------------------------------------------------------------------===//

void HarvestReport::Add(ReportEntry entry) {
	if (finalized_) {
		throw duckdb::InternalException("cannot add '" + entry.source_id + "' to a finalized report");
	}
	if (index_.count(entry.source_id) > 0) {
		throw duckdb::InvalidInputException("duplicate source id '" + entry.source_id + "' in report");
	}
	index_.emplace(entry.source_id, entries_.size());
	entries_.push_back(std::move(entry));
}

void HarvestReport::Finalize(std::chrono::system_clock::time_point finished_at) {
	finished_at_ = finished_at;
	finalized_ = true;
}

const ReportEntry *HarvestReport::Find(const std::string &source_id) const {
	auto it = index_.find(source_id);
	if (it == index_.end()) {
		return nullptr;
	}
	return &entries_[it->second];
}

size_t HarvestReport::Count(EntryStatus status) const {
	size_t count = 0;
	for (const auto &entry : entries_) {
		if (entry.status == status) {
			count++;
		}
	}
	return count;
}

bool HarvestReport::IsComplete() const {
	return Count(EntryStatus::INCOMPLETE) == 0;
}

//===--------------------------------------------------------------------===//
// Serialization
//===--------------------------------------------------------------------===//

// Keys with fixed meaning inside an entry object; every other array-valued
// key is a text collection
static const std::set<std::string> &ReservedKeys() {
	static const std::set<std::string> keys = {"status", "site",       "title",     "failure",
	                                           "error_type", "players", "extensions", "scraping_info"};
	return keys;
}

static void AddKey(yyjson_mut_doc *doc, yyjson_mut_val *obj, const std::string &key, yyjson_mut_val *val) {
	yyjson_mut_obj_add(obj, yyjson_mut_strncpy(doc, key.c_str(), key.size()), val);
}

static yyjson_mut_val *BuildScrapingInfo(yyjson_mut_doc *doc, const ReportEntry &entry) {
	yyjson_mut_val *info = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_strcpy(doc, info, "url", entry.url.c_str());
	yyjson_mut_obj_add_int(doc, info, "status_code", entry.status_code);
	yyjson_mut_obj_add_int(doc, info, "attempts", entry.attempts);
	yyjson_mut_obj_add_real(doc, info, "response_time", static_cast<double>(entry.elapsed_ms) / 1000.0);
	yyjson_mut_obj_add_int(doc, info, "elapsed_ms", entry.elapsed_ms);
	yyjson_mut_obj_add_strcpy(doc, info, "timestamp", entry.captured_at.c_str());
	return info;
}

static yyjson_mut_val *BuildEntry(yyjson_mut_doc *doc, const ReportEntry &entry) {
	yyjson_mut_val *obj = yyjson_mut_obj(doc);
	yyjson_mut_obj_add_str(doc, obj, "status", EntryStatusToString(entry.status));

	if (entry.Succeeded()) {
		const auto &record = entry.record;
		yyjson_mut_obj_add_strcpy(doc, obj, "site", record.site.c_str());
		yyjson_mut_obj_add_strcpy(doc, obj, "title", record.title.c_str());
		for (const auto &collection : record.collections) {
			yyjson_mut_val *items = yyjson_mut_arr(doc);
			for (const auto &item : collection.items) {
				yyjson_mut_arr_add_strcpy(doc, items, item.c_str());
			}
			AddKey(doc, obj, collection.label, items);
		}
		if (!record.players.empty()) {
			yyjson_mut_val *players = yyjson_mut_arr(doc);
			for (const auto &player : record.players) {
				yyjson_mut_val *p = yyjson_mut_arr_add_obj(doc, players);
				yyjson_mut_obj_add_strcpy(doc, p, "name", player.name.c_str());
				yyjson_mut_obj_add_strcpy(doc, p, "age", player.age.c_str());
				yyjson_mut_obj_add_strcpy(doc, p, "club", player.club.c_str());
			}
			yyjson_mut_obj_add_val(doc, obj, "players", players);
		}
		if (!record.extensions.empty()) {
			yyjson_mut_val *extensions = yyjson_mut_obj(doc);
			for (const auto &field : record.extensions) {
				AddKey(doc, extensions, field.first, yyjson_mut_strncpy(doc, field.second.c_str(), field.second.size()));
			}
			yyjson_mut_obj_add_val(doc, obj, "extensions", extensions);
		}
	} else {
		yyjson_mut_obj_add_strcpy(doc, obj, "failure", entry.failure.c_str());
		yyjson_mut_obj_add_str(doc, obj, "error_type", ErrorTypeToString(entry.error_type));
	}

	yyjson_mut_obj_add_val(doc, obj, "scraping_info", BuildScrapingInfo(doc, entry));
	return obj;
}

std::string SerializeReport(const HarvestReport &report) {
	YyjsonMutDocGuard guard;
	if (!guard) {
		throw duckdb::InternalException("failed to allocate JSON document");
	}
	yyjson_mut_doc *doc = guard.get();
	yyjson_mut_val *root = yyjson_mut_obj(doc);
	yyjson_mut_doc_set_root(doc, root);

	for (const auto &entry : report.Entries()) {
		AddKey(doc, root, entry.source_id, BuildEntry(doc, entry));
	}

	size_t len = 0;
	YyjsonStringGuard json(yyjson_mut_write(doc, YYJSON_WRITE_PRETTY_TWO_SPACES, &len));
	if (!json) {
		throw duckdb::InternalException("failed to serialize harvest report");
	}
	return std::string(json.get(), len) + "\n";
}

//===--------------------------------------------------------------------===//
// Parsing
//===--------------------------------------------------------------------===//

static std::string GetString(yyjson_val *obj, const char *key) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	return yyjson_is_str(val) ? std::string(yyjson_get_str(val), yyjson_get_len(val)) : std::string();
}

static int64_t GetInt(yyjson_val *obj, const char *key) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	if (yyjson_is_uint(val)) {
		return static_cast<int64_t>(yyjson_get_uint(val));
	}
	return yyjson_is_sint(val) ? yyjson_get_sint(val) : 0;
}

static ReportEntry ParseEntry(const std::string &source_id, yyjson_val *obj) {
	if (!yyjson_is_obj(obj)) {
		throw duckdb::InvalidInputException("snapshot entry '" + source_id + "' is not an object");
	}
	ReportEntry entry;
	entry.source_id = source_id;
	entry.status = EntryStatusFromString(GetString(obj, "status"));

	yyjson_val *info = yyjson_obj_get(obj, "scraping_info");
	if (yyjson_is_obj(info)) {
		entry.url = GetString(info, "url");
		entry.status_code = static_cast<int>(GetInt(info, "status_code"));
		entry.attempts = static_cast<int>(GetInt(info, "attempts"));
		entry.elapsed_ms = GetInt(info, "elapsed_ms");
		entry.captured_at = GetString(info, "timestamp");
	}

	if (!entry.Succeeded()) {
		entry.failure = GetString(obj, "failure");
		entry.error_type = ErrorTypeFromString(GetString(obj, "error_type"));
		return entry;
	}

	auto &record = entry.record;
	record.site = GetString(obj, "site");
	record.title = GetString(obj, "title");

	size_t idx, max;
	yyjson_val *key, *val;
	yyjson_obj_foreach(obj, idx, max, key, val) {
		std::string name(yyjson_get_str(key), yyjson_get_len(key));
		if (ReservedKeys().count(name) > 0 || !yyjson_is_arr(val)) {
			continue;
		}
		auto &collection = record.Collection(name);
		size_t item_idx, item_max;
		yyjson_val *item;
		yyjson_arr_foreach(val, item_idx, item_max, item) {
			if (yyjson_is_str(item)) {
				collection.items.emplace_back(yyjson_get_str(item), yyjson_get_len(item));
			}
		}
	}

	yyjson_val *players = yyjson_obj_get(obj, "players");
	if (yyjson_is_arr(players)) {
		size_t player_idx, player_max;
		yyjson_val *player;
		yyjson_arr_foreach(players, player_idx, player_max, player) {
			record.players.push_back(
			    PlayerCandidate {GetString(player, "name"), GetString(player, "age"), GetString(player, "club")});
		}
	}

	yyjson_val *extensions = yyjson_obj_get(obj, "extensions");
	if (yyjson_is_obj(extensions)) {
		yyjson_obj_foreach(extensions, idx, max, key, val) {
			if (yyjson_is_str(val)) {
				record.extensions[yyjson_get_str(key)] = std::string(yyjson_get_str(val), yyjson_get_len(val));
			}
		}
	}

	record.provenance.url = entry.url;
	record.provenance.status_code = entry.status_code;
	record.provenance.latency_ms = entry.elapsed_ms;
	record.provenance.attempts = entry.attempts;
	record.provenance.captured_at = entry.captured_at;
	return entry;
}

static HarvestReport ParseRoot(yyjson_val *root) {
	if (!yyjson_is_obj(root)) {
		throw duckdb::InvalidInputException("snapshot root must be a JSON object");
	}
	HarvestReport report;
	size_t idx, max;
	yyjson_val *key, *val;
	yyjson_obj_foreach(root, idx, max, key, val) {
		report.Add(ParseEntry(std::string(yyjson_get_str(key), yyjson_get_len(key)), val));
	}
	report.Finalize(report.FinishedAt());
	return report;
}

HarvestReport ParseSnapshot(const std::string &json) {
	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_opts(const_cast<char *>(json.data()), json.size(), 0, nullptr, &err));
	if (!doc) {
		throw duckdb::InvalidInputException("invalid snapshot JSON at offset " + std::to_string(err.pos) + ": " +
		                                    err.msg);
	}
	return ParseRoot(yyjson_doc_get_root(doc.get()));
}

HarvestReport LoadSnapshot(const std::string &path) {
	yyjson_read_err err;
	YyjsonDocGuard doc(yyjson_read_file(path.c_str(), 0, nullptr, &err));
	if (!doc) {
		if (err.code == YYJSON_READ_ERROR_FILE_OPEN || err.code == YYJSON_READ_ERROR_FILE_READ) {
			throw duckdb::IOException("cannot read snapshot '" + path + "': " + err.msg);
		}
		throw duckdb::InvalidInputException("invalid snapshot JSON in '" + path + "' at offset " +
		                                    std::to_string(err.pos) + ": " + err.msg);
	}
	return ParseRoot(yyjson_doc_get_root(doc.get()));
}

} // namespace harvester
