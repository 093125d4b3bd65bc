#pragma once

// RelataCore - relation abstraction over pluggable data sources
//
// Usage:
//   #include <RelataCore.hpp>
//
//   int main() {
//       auto gw = relata::gateway::setup(relata::adapter_id{"memory"});
//
//       auto users = std::make_shared<relata::relation_definition>("users",
//           relata::schema("users", {
//               {"id", relata::types::coercible::integer()},
//               {"name", relata::types::string()},
//           }));
//       users->view("names", {"name"}, [](const relata::relation& r, const relata::arguments_t&) {
//           return r.order({"name"});
//       });
//
//       auto rel = gw->relation_for(users);
//       rel << relata::tuple_t{{"id", std::string("1")}, {"name", std::string("Jane")}};
//
//       for (const auto& tuple : rel.view("names")) {
//           std::cout << relata::value_to_string(tuple.at("name")) << std::endl;
//       }
//   }

#include "relata/types.hpp"
#include "relata/errors.hpp"
#include "relata/log.hpp"
#include "relata/association.hpp"
#include "relata/schema.hpp"
#include "relata/dataset.hpp"
#include "relata/mapper_registry.hpp"
#include "relata/relation.hpp"
#include "relata/transaction.hpp"
#include "relata/gateway.hpp"
#include "relata/memory.hpp"
#include "relata/sqlite.hpp"
