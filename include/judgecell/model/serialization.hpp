#pragma once

#include <boost/uuid/uuid.hpp>
#include <nlohmann/json.hpp>
#include "judgecell/model/error_info.hpp"
#include "judgecell/model/language.hpp"
#include "judgecell/model/status.hpp"
#include "judgecell/model/submission.hpp"

/**
 * JSON 编解码
 * 字段名与评测队列、结果存储两端约定一致，解码时校验字段类型，
 * 字段缺失或类型不正确时抛出 std::invalid_argument。
 *
 * 评测状态的编码：
 * "Accepted"
 * {"RuntimeError": "SegmentationFault"}
 *
 * 源代码、输入输出和错误信息是任意字节，合法的 UTF-8 编码为字符串，
 * 否则编码为 {"base64": "..."}。
 */
namespace judgecell {

std::string uuid_to_string(const boost::uuids::uuid &uuid);

/**
 * @throw std::invalid_argument 不是合法的 uuid
 */
boost::uuids::uuid parse_uuid(const std::string &str);

/**
 * @brief 无损编码任意字节，非 UTF-8 的内容编码为 {"base64": "..."}
 */
nlohmann::json encode_bytes(const std::string &bytes);

/**
 * @brief 解码 encode_bytes 的结果
 * @throw std::invalid_argument 既不是字符串也不是合法的 base64 对象
 */
std::string decode_bytes(const nlohmann::json &j);

void to_json(nlohmann::json &j, language lang);
void from_json(const nlohmann::json &j, language &lang);

void to_json(nlohmann::json &j, const judge_status &status);
void from_json(const nlohmann::json &j, judge_status &status);

void to_json(nlohmann::json &j, const error_info &info);
void from_json(const nlohmann::json &j, error_info &info);

void to_json(nlohmann::json &j, const submission &sub);
void from_json(const nlohmann::json &j, submission &sub);

void to_json(nlohmann::json &j, const test_case &tc);
void from_json(const nlohmann::json &j, test_case &tc);

/**
 * @brief 解码评测任务
 * needs_compilation 必须与提交的语言一致，use_sandbox 必须为 true
 */
void to_json(nlohmann::json &j, const judge_task &task);
void from_json(const nlohmann::json &j, judge_task &task);

void to_json(nlohmann::json &j, const test_case_result &result);
void from_json(const nlohmann::json &j, test_case_result &result);

void to_json(nlohmann::json &j, const judge_result &result);
void from_json(const nlohmann::json &j, judge_result &result);

}  // namespace judgecell
