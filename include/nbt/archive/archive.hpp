#pragma once

// ============================================================================
// Archive - bind plain C++ structs to NBT tag trees
// ============================================================================
//
// - Key-based access: missing keys leave fields at their defaults
// - Automatic binding for types with an ADL fields() function
// - Enums stored as String tags via ADL to_string/from_string
// - Dot-path overrides for configuration structs
//
// Basic usage:
//
//   struct spawn_point_t {
//       int32_t x = 0;
//       int32_t y = 64;
//       int32_t z = 0;
//       std::string dimension = "overworld";
//   };
//
//   auto fields(const spawn_point_t& s) {
//       return std::make_tuple(
//           nbt::archive::field("x", s.x),
//           nbt::archive::field("y", s.y),
//           nbt::archive::field("z", s.z),
//           nbt::archive::field("dimension", s.dimension)
//       );
//   }
//   auto fields(spawn_point_t& s) { ...same, non-const... }
//
//   // Struct -> Compound
//   auto doc = nbt::document_t("", nbt::archive::to_compound(spawn_point_t{}));
//   doc.save_file("spawn.dat");
//
//   // Compound -> struct
//   auto spawn = nbt::archive::from_compound<spawn_point_t>(
//       nbt::document_t::load_file("spawn.dat"));
//
//   // Override by path
//   nbt::archive::set(spawn, "dimension", "nether");
//
// ============================================================================

#include "protocol.hpp"
#include "sink.hpp"
#include "source.hpp"
