#include "core/tile_service.hpp"
#include <algorithm>
#include <cpr/cpr.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace sector_mapper
{

auto tile_service_t::make_key(int z, int x, int y) -> tile_key_t
{
  return std::format("{}/{}/{}", z, x, y);
}

auto tile_service_t::tile_url(tile_source_t source, int z, int x, int y) -> std::string
{
  if (source == tile_source_t::SATELLITE)
  {
    // Esri World Imagery uses z/y/x ordering
    return std::format("https://server.arcgisonline.com/ArcGIS/rest/services/World_Imagery/MapServer/tile/{}/{}/{}", z, y, x);
  }
  return std::format("https://tile.openstreetmap.org/{}/{}/{}.png", z, x, y);
}

auto tile_service_t::cache_path(tile_source_t source, int z, int x, int y) -> std::string
{
  fs::path dir = ".cache/tiles";
  dir /= (source == tile_source_t::SATELLITE) ? "satellite" : "osm";
  return (dir / std::format("{}_{}_{}.png", z, x, y)).string();
}

auto tile_service_t::set_source(tile_source_t source) -> void
{
  if (m_source == source)
    return;

  m_source = source;
  // In-flight downloads still land in the disk cache for their own source
  m_cache.clear();
  m_pending.clear();
  m_failed.clear();
}

auto tile_service_t::get_source() const -> tile_source_t
{
  return m_source;
}

auto tile_service_t::is_loading(const tile_key_t &key) const -> bool
{
  return std::any_of(m_pending.begin(), m_pending.end(), [&](const pending_tile_t &p) { return p.key == key; });
}

auto tile_service_t::get_tile(int z, int x, int y) -> std::shared_ptr<texture_t>
{
  auto key = make_key(z, x, y);

  auto it = m_cache.find(key);
  if (it != m_cache.end())
  {
    return it->second;
  }

  if (is_loading(key) || m_failed.count(key))
    return nullptr;

  const std::string file_path = cache_path(m_source, z, x, y);

  std::error_code ec;
  if (fs::exists(file_path, ec))
  {
    std::ifstream f(file_path, std::ios::binary);
    std::vector<unsigned char> buffer(std::istreambuf_iterator<char>(f), {});

    auto texture = std::make_shared<texture_t>();
    if (!buffer.empty() && texture->load_from_memory(buffer.data(), buffer.size()))
    {
      m_cache[key] = texture;
      return texture;
    }
    // Corrupt cache entry, fall through and fetch again
  }

  const std::string url = tile_url(m_source, z, x, y);

  m_pending.push_back({key, std::async(std::launch::async,
                                       [url, file_path]()
                                       {
                                         cpr::Response r = cpr::Get(cpr::Url{url}, cpr::Header{{"User-Agent", "SectorMapper/0.1"}});
                                         if (r.status_code != 200)
                                         {
                                           std::cerr << "Tiles: " << url << " returned " << r.status_code << std::endl;
                                           return std::string();
                                         }

                                         std::error_code dir_ec;
                                         fs::path p(file_path);
                                         fs::create_directories(p.parent_path(), dir_ec);
                                         std::ofstream out(p, std::ios::binary);
                                         if (dir_ec || !out.is_open())
                                         {
                                           std::cerr << "Tiles: Could not cache " << file_path << std::endl;
                                         }
                                         else
                                         {
                                           out.write(r.text.data(), static_cast<std::streamsize>(r.text.size()));
                                         }
                                         return r.text;
                                       })});

  return nullptr;
}

auto tile_service_t::update() -> void
{
  auto it = m_pending.begin();
  while (it != m_pending.end())
  {
    if (it->data_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
      ++it;
      continue;
    }

    std::string data = it->data_future.get();
    auto texture = std::make_shared<texture_t>();
    if (!data.empty() && texture->load_from_memory(reinterpret_cast<const unsigned char *>(data.data()), data.size()))
    {
      m_cache[it->key] = texture;
    }
    else
    {
      m_failed.insert(it->key);
    }

    it = m_pending.erase(it);
  }
}

} // namespace sector_mapper
