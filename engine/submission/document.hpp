#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docgate {

struct Description {
  std::string participant_inn;
};

// One product entry of a document
struct Product {
  std::string certificate_document;
  std::string certificate_document_date;
  std::string certificate_document_number;
  std::string owner_inn;
  std::string producer_inn;
  std::string production_date;
  std::string tnved_code;
  std::string uit_code;
  std::string uitu_code;
};

// Goods-introduction document submitted to the remote endpoint
struct Document {
  std::optional<Description> description;
  std::string doc_id;
  std::string doc_status;
  std::string doc_type;
  bool import_request = false;
  std::string owner_inn;
  std::string participant_inn;
  std::string producer_inn;
  std::string production_date;
  std::string production_type;
  std::vector<Product> products;
  std::string reg_date;
  std::string reg_number;
};

}  // namespace docgate
