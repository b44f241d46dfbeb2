#pragma once

#include "ui/texture.hpp"
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sector_mapper
{

// Key for tile cache: "z/x/y"
using tile_key_t = std::string;

class tile_service_t
{
public:
  enum class tile_source_t
  {
    OSM,
    SATELLITE
  };

  tile_service_t() = default;
  ~tile_service_t() = default;

  auto set_source(tile_source_t source) -> void;
  auto get_source() const -> tile_source_t;

  // Returns the texture if loaded, nullptr while pending. Triggers a fetch on a miss.
  auto get_tile(int z, int x, int y) -> std::shared_ptr<texture_t>;

  // Call once per frame; textures must be created on the GL thread
  auto update() -> void;

  static auto tile_url(tile_source_t source, int z, int x, int y) -> std::string;
  static auto cache_path(tile_source_t source, int z, int x, int y) -> std::string;

private:
  struct pending_tile_t
  {
    tile_key_t key;
    std::future<std::string> data_future;
  };

  std::map<tile_key_t, std::shared_ptr<texture_t>> m_cache;
  std::vector<pending_tile_t> m_pending;
  std::set<tile_key_t> m_failed; // not re-requested until the source changes
  tile_source_t m_source = tile_source_t::OSM;

  auto is_loading(const tile_key_t &key) const -> bool;
  static auto make_key(int z, int x, int y) -> tile_key_t;
};

} // namespace sector_mapper
