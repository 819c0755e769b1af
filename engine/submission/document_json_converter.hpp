#pragma once

#include "engine/submission/document.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace docgate {

/**
 * @brief Converts Document to and from the endpoint's JSON form
 *
 * Produces:
 * {
 *   "description": {"participantInn": "..."} | null,
 *   "doc_id": "...", "doc_status": "...", "doc_type": "...",
 *   "importRequest": true,
 *   "owner_inn": "...", "participant_inn": "...", "producer_inn": "...",
 *   "production_date": "...", "production_type": "...",
 *   "products": [{certificate_document, ..., uitu_code}],
 *   "reg_date": "...", "reg_number": "..."
 * }
 *
 * All methods are static (stateless converter). Failures are reported as
 * SerializationError with the JSON library error nested.
 */
class DocumentJsonConverter {
 public:
  /** @brief Convert to compact JSON string */
  static std::string ToJson(const Document& document);

  /** @brief Convert to JSON object */
  static nlohmann::json ToJsonObject(const Document& document);

  /** @brief Parse a JSON string */
  static Document FromJson(const std::string& json_text);

  /** @brief Read a JSON object; missing keys leave fields at their defaults */
  static Document FromJsonObject(const nlohmann::json& json_obj);

 private:
  static nlohmann::json ProductToJson(const Product& product);
  static Product ProductFromJson(const nlohmann::json& json_obj);
};

}  // namespace docgate
