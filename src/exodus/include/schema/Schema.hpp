#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file Schema.hpp
 * @brief Exodus II schema constants and the deterministic dimension / variable names.
 *
 * @details
 * @rst
 * Fixed dimensions are schema constants and are never configurable:
 *
 * ============== ===== ==========================================
 * dimension      size  meaning
 * ============== ===== ==========================================
 * ``len_string`` 33    generic string storage
 * ``len_line``   81    one info record (80 chars + padding)
 * ``four``       4     QA record width
 * ``len_name``   33    one entity / variable name (32 + padding)
 * ``time_step``  1     the time axis; not growable
 * ============== ===== ==========================================
 *
 * Per-entity names take the 1-based allocator slot, e.g. ``connect3`` or
 * ``vals_elem_var2eb1``.
 * @endrst
 */

namespace exodus::schema
{

inline constexpr std::size_t kLenString = 33;
inline constexpr std::size_t kLenLine = 81;
inline constexpr std::size_t kFour = 4;
inline constexpr std::size_t kLenName = 33;
inline constexpr std::size_t kTimeSteps = 1;

inline constexpr std::int32_t kMaxNameLength = 32;
inline constexpr float kApiVersion = 6.30000019f;
inline constexpr float kDbVersion = 6.30000019f;
inline constexpr std::int32_t kFileSize = 1;
inline constexpr std::int32_t kInt64Status = 0;

// Property-array value of a slot no entity has claimed yet.
inline constexpr std::int32_t kUnassignedId = -1;

namespace dim
{
inline constexpr const char* kLenString = "len_string";
inline constexpr const char* kLenLine = "len_line";
inline constexpr const char* kFour = "four";
inline constexpr const char* kLenName = "len_name";
inline constexpr const char* kTimeStep = "time_step";
inline constexpr const char* kNumDim = "num_dim";
inline constexpr const char* kNumNodes = "num_nodes";
inline constexpr const char* kNumElem = "num_elem";
inline constexpr const char* kNumElBlk = "num_el_blk";
inline constexpr const char* kNumSideSets = "num_side_sets";
inline constexpr const char* kNumInfo = "num_info";
inline constexpr const char* kNumGloVar = "num_glo_var";
inline constexpr const char* kNumElemVar = "num_elem_var";
inline constexpr const char* kNumNodVar = "num_nod_var";
} // namespace dim

namespace var
{
inline constexpr const char* kCoorNames = "coor_names";
inline constexpr const char* kEbNames = "eb_names";
inline constexpr const char* kEbStatus = "eb_status";
inline constexpr const char* kEbProp1 = "eb_prop1";
inline constexpr const char* kSsNames = "ss_names";
inline constexpr const char* kSsStatus = "ss_status";
inline constexpr const char* kSsProp1 = "ss_prop1";
inline constexpr const char* kTimeWhole = "time_whole";
inline constexpr const char* kInfoRecords = "info_records";
inline constexpr const char* kNameGloVar = "name_glo_var";
inline constexpr const char* kValsGloVar = "vals_glo_var";
inline constexpr const char* kNameElemVar = "name_elem_var";
inline constexpr const char* kNameNodVar = "name_nod_var";
} // namespace var

namespace attr
{
inline constexpr const char* kApiVersion = "api_version";
inline constexpr const char* kVersion = "version";
inline constexpr const char* kFloatWordSize = "floating_point_word_size";
inline constexpr const char* kFileSize = "file_size";
inline constexpr const char* kMaxNameLength = "maximum_name_length";
inline constexpr const char* kInt64Status = "int64_status";
inline constexpr const char* kTitle = "title";
inline constexpr const char* kName = "name";
inline constexpr const char* kElemType = "elem_type";
} // namespace attr

// "coordx", "coordy", "coordz" for axis 0, 1, 2
std::string coord_var(int axis);

std::string num_el_in_blk(int slot);
std::string num_nod_per_el(int slot);
std::string connect(int slot);

std::string num_side_ss(int slot);
std::string elem_ss(int slot);
std::string side_ss(int slot);

std::string vals_nod_var(int var_index);
std::string vals_elem_var(int var_index, int block_slot);

// Throws ValidationError unless 1 <= step <= kTimeSteps.
void check_step(int step);

} // namespace exodus::schema
