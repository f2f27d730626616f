#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/category_summary_record.hpp"
#include "internal/db/model/memory_record.hpp"
#include "recall/memory/v1.hpp"

namespace recall::core {

/*
  Mapping between persistent rows, proto enums and the lowercase names used
  on the collaborator wire and in logs.
*/

std::string_view KindName(recall::memory::v1::MemoryKind kind);
std::optional<recall::memory::v1::MemoryKind> ParseKind(std::string_view name);

std::string_view SensitivityName(recall::memory::v1::Sensitivity sensitivity);
// Empty maps to normal; unknown names yield nullopt.
std::optional<recall::memory::v1::Sensitivity> ParseSensitivity(std::string_view name);

std::string_view StatusName(recall::memory::v1::RecordStatus status);
std::string_view OperationName(recall::memory::v1::Operation op);
std::string_view StrategyName(recall::memory::v1::MergeStrategy strategy);
std::string_view OutcomeName(recall::memory::v1::OperationOutcome outcome);
std::string_view JobTypeName(recall::memory::v1::JobType type);

recall::memory::v1::MemoryRecordView    ToView(const db::model::MemoryRecord& record, double similarity = 0.0);
recall::memory::v1::CategorySummaryView ToView(const db::model::CategorySummaryRecord& summary);

// Full row contents as JSON, kept in the audit log for hard deletes.
std::string SnapshotJson(const db::model::MemoryRecord& record);

} // namespace recall::core
