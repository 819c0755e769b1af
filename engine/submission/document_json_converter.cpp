#include "document_json_converter.hpp"
#include "engine/common/errors.hpp"

#include <exception>

namespace docgate {

namespace {

void ReadString(const nlohmann::json& json_obj, const char* key, std::string& field) {
  auto it = json_obj.find(key);
  if (it == json_obj.end() || it->is_null()) {
    return;
  }
  if (!it->is_string()) {
    throw SerializationError(std::string("Field '") + key + "' must be a string");
  }
  field = it->get<std::string>();
}

}  // namespace

std::string DocumentJsonConverter::ToJson(const Document& document) {
  nlohmann::json json_obj = ToJsonObject(document);
  try {
    return json_obj.dump();
  } catch (const nlohmann::json::exception&) {
    // Non-UTF-8 string content
    std::throw_with_nested(SerializationError("Failed to serialize document '" + document.doc_id + "'"));
  }
}

nlohmann::json DocumentJsonConverter::ToJsonObject(const Document& document) {
  nlohmann::json json_obj;

  if (document.description) {
    json_obj["description"] = {{"participantInn", document.description->participant_inn}};
  } else {
    json_obj["description"] = nullptr;
  }
  json_obj["doc_id"] = document.doc_id;
  json_obj["doc_status"] = document.doc_status;
  json_obj["doc_type"] = document.doc_type;
  json_obj["importRequest"] = document.import_request;
  json_obj["owner_inn"] = document.owner_inn;
  json_obj["participant_inn"] = document.participant_inn;
  json_obj["producer_inn"] = document.producer_inn;
  json_obj["production_date"] = document.production_date;
  json_obj["production_type"] = document.production_type;

  nlohmann::json products_array = nlohmann::json::array();
  for (const auto& product : document.products) {
    products_array.push_back(ProductToJson(product));
  }
  json_obj["products"] = products_array;

  json_obj["reg_date"] = document.reg_date;
  json_obj["reg_number"] = document.reg_number;
  return json_obj;
}

Document DocumentJsonConverter::FromJson(const std::string& json_text) {
  nlohmann::json json_obj;
  try {
    json_obj = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception&) {
    std::throw_with_nested(SerializationError("Document is not valid JSON"));
  }
  return FromJsonObject(json_obj);
}

Document DocumentJsonConverter::FromJsonObject(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw SerializationError("Document JSON must be an object");
  }

  Document document;

  auto description = json_obj.find("description");
  if (description != json_obj.end() && !description->is_null()) {
    if (!description->is_object()) {
      throw SerializationError("Field 'description' must be an object");
    }
    Description parsed;
    ReadString(*description, "participantInn", parsed.participant_inn);
    document.description = parsed;
  }

  ReadString(json_obj, "doc_id", document.doc_id);
  ReadString(json_obj, "doc_status", document.doc_status);
  ReadString(json_obj, "doc_type", document.doc_type);

  auto import_request = json_obj.find("importRequest");
  if (import_request != json_obj.end() && !import_request->is_null()) {
    if (!import_request->is_boolean()) {
      throw SerializationError("Field 'importRequest' must be a boolean");
    }
    document.import_request = import_request->get<bool>();
  }

  ReadString(json_obj, "owner_inn", document.owner_inn);
  ReadString(json_obj, "participant_inn", document.participant_inn);
  ReadString(json_obj, "producer_inn", document.producer_inn);
  ReadString(json_obj, "production_date", document.production_date);
  ReadString(json_obj, "production_type", document.production_type);

  auto products = json_obj.find("products");
  if (products != json_obj.end() && !products->is_null()) {
    if (!products->is_array()) {
      throw SerializationError("Field 'products' must be an array");
    }
    for (const auto& product : *products) {
      document.products.push_back(ProductFromJson(product));
    }
  }

  ReadString(json_obj, "reg_date", document.reg_date);
  ReadString(json_obj, "reg_number", document.reg_number);
  return document;
}

nlohmann::json DocumentJsonConverter::ProductToJson(const Product& product) {
  nlohmann::json product_json;
  product_json["certificate_document"] = product.certificate_document;
  product_json["certificate_document_date"] = product.certificate_document_date;
  product_json["certificate_document_number"] = product.certificate_document_number;
  product_json["owner_inn"] = product.owner_inn;
  product_json["producer_inn"] = product.producer_inn;
  product_json["production_date"] = product.production_date;
  product_json["tnved_code"] = product.tnved_code;
  product_json["uit_code"] = product.uit_code;
  product_json["uitu_code"] = product.uitu_code;
  return product_json;
}

Product DocumentJsonConverter::ProductFromJson(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw SerializationError("Product entry must be an object");
  }
  Product product;
  ReadString(json_obj, "certificate_document", product.certificate_document);
  ReadString(json_obj, "certificate_document_date", product.certificate_document_date);
  ReadString(json_obj, "certificate_document_number", product.certificate_document_number);
  ReadString(json_obj, "owner_inn", product.owner_inn);
  ReadString(json_obj, "producer_inn", product.producer_inn);
  ReadString(json_obj, "production_date", product.production_date);
  ReadString(json_obj, "tnved_code", product.tnved_code);
  ReadString(json_obj, "uit_code", product.uit_code);
  ReadString(json_obj, "uitu_code", product.uitu_code);
  return product;
}

}  // namespace docgate
