#include "DeviceConfig.hpp"

#include <cstdio>
#include <cstdlib>

#include "common/cs_dbg.h"
#include "common/cs_file.h"
#include "frozen.h"
#include "mgos.hpp"

namespace tpms {

int DeviceConfig::Device::GetExpectedData() const {
  return (expected_data >= 0 ? expected_data : profile->expected_data);
}

int DeviceConfig::Device::GetExpectedConfig() const {
  return (expected_config >= 0 ? expected_config : profile->expected_config);
}

std::string DeviceConfig::Device::ToJSON() const {
  std::string res = mgos::JSONPrintStringf(
      "{id: %Q, addr: %Q, family: %Q, moving: %B", id.c_str(),
      addr.ToString().c_str(), profile->name, moving);
  if (expected_data >= 0) {
    mgos::JSONAppendStringf(&res, ", expected_data: %d", expected_data);
  }
  if (expected_config >= 0) {
    mgos::JSONAppendStringf(&res, ", expected_config: %d", expected_config);
  }
  res.append(", \"sensors\": {");
  bool first = true;
  for (const auto &it : sensors.entries()) {
    if (!first) res.append(", ");
    mgos::JSONAppendStringf(&res, "%Q: %Q", PositionLabel(it.first).c_str(),
                            it.second.ToString().c_str());
    first = false;
  }
  res.append("}, \"names\": {");
  first = true;
  for (const auto &it : names) {
    if (!first) res.append(", ");
    mgos::JSONAppendStringf(&res, "%Q: %Q", PositionLabel(it.first).c_str(),
                            it.second.c_str());
    first = false;
  }
  res.append("}}");
  return res;
}

// static
StatusOr<DeviceConfig::Device> DeviceConfig::ParseDevice(Str json) {
  Device dev;
  char *id = nullptr, *addr = nullptr, *family = nullptr;
  struct json_token sensors_tok = {};
  json_scanf(json.p, json.len,
             "{id: %Q, addr: %Q, family: %Q, moving: %B, expected_data: %d, "
             "expected_config: %d, sensors: %T}",
             &id, &addr, &family, &dev.moving, &dev.expected_data,
             &dev.expected_config, &sensors_tok);
  mgos::ScopedCPtr id_owner(id), addr_owner(addr), family_owner(family);
  if (id == nullptr || id[0] == '\0') {
    return Errorf(STATUS_INVALID_ARGUMENT, "device id is required");
  }
  dev.id = id;
  dev.addr = blepoll::bt::Addr(Str(addr));
  if (!dev.addr.IsValid()) {
    return Errorf(STATUS_INVALID_ARGUMENT, "%s: invalid address", id);
  }
  auto ps = DeviceProfile::Find(Str(family));
  if (!ps.ok()) {
    return Errorf(STATUS_INVALID_ARGUMENT, "%s: %s", id,
                  ps.status().error_message().c_str());
  }
  dev.profile = ps.ValueOrDie();
  // -1 is the same as absent.
  if (dev.expected_data != -1 && dev.expected_data < 1) {
    return Errorf(STATUS_INVALID_ARGUMENT, "%s: invalid expected_data %d", id,
                  dev.expected_data);
  }
  if (dev.expected_config != -1 && dev.expected_config < 0) {
    return Errorf(STATUS_INVALID_ARGUMENT, "%s: invalid expected_config %d",
                  id, dev.expected_config);
  }

  void *h = nullptr;
  struct json_token key, val;
  if (sensors_tok.ptr == nullptr) {
    dev.sensors = PositionMap::Defaults();
  } else if (sensors_tok.len == 0 || sensors_tok.ptr[0] != '{') {
    return Errorf(STATUS_INVALID_ARGUMENT, "%s: sensors must be an object",
                  id);
  }
  while ((h = json_next_key(json.p, json.len, h, ".sensors", &key, &val)) !=
         nullptr) {
    auto poss = ParsePositionLabel(Str(key.ptr, key.len));
    if (!poss.ok()) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: %s", id,
                    poss.status().error_message().c_str());
    }
    auto ids = SensorID::Parse(Str(val.ptr, val.len));
    if (!ids.ok()) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: %s", id,
                    ids.status().error_message().c_str());
    }
    Status st = dev.sensors.Add(poss.ValueOrDie(), ids.ValueOrDie());
    if (!st.ok()) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: %s", id,
                    st.error_message().c_str());
    }
  }

  h = nullptr;
  while ((h = json_next_key(json.p, json.len, h, ".names", &key, &val)) !=
         nullptr) {
    auto poss = ParsePositionLabel(Str(key.ptr, key.len));
    if (!poss.ok()) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: %s", id,
                    poss.status().error_message().c_str());
    }
    // Tokens come escaped as in the file.
    std::string name(val.len, '\0');
    const int n = json_unescape(val.ptr, val.len, &name[0], name.size());
    if (val.type != JSON_TYPE_STRING || n < 0) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: invalid name for %.*s", id,
                    (int) key.len, key.ptr);
    }
    name.resize(n);
    dev.names[poss.ValueOrDie()] = name;
  }
  return dev;
}

// static
StatusOr<DeviceConfig> DeviceConfig::Parse(Str json) {
  DeviceConfig res;
  void *h = nullptr;
  int idx = 0;
  struct json_token val;
  while ((h = json_next_elem(json.p, json.len, h, ".devices", &idx, &val)) !=
         nullptr) {
    if (val.len == 0 || val.ptr[0] != '{') {
      return Errorf(STATUS_INVALID_ARGUMENT, "devices[%d]: not an object",
                    idx);
    }
    auto ds = ParseDevice(Str(val.ptr, val.len));
    if (!ds.ok()) return ds.status();
    const Device &dev = ds.ValueOrDie();
    if (res.Find(dev.id) != nullptr) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%s: duplicate device id",
                    dev.id.c_str());
    }
    res.devices.push_back(dev);
  }
  return res;
}

// static
StatusOr<DeviceConfig> DeviceConfig::Load(const std::string &path) {
  size_t size = 0;
  char *data = cs_read_file(path.c_str(), &size);
  if (data == nullptr) {
    return Errorf(STATUS_NOT_FOUND, "%s: not found", path.c_str());
  }
  mgos::ScopedCPtr data_owner(data);
  auto res = Parse(Str(data, size));
  if (res.ok()) {
    LOG(LL_INFO, ("Loaded %d devices from %s",
                  (int) res.ValueOrDie().devices.size(), path.c_str()));
  }
  return res;
}

std::string DeviceConfig::ToJSON() const {
  std::string res("{\"devices\": [");
  bool first = true;
  for (const auto &dev : devices) {
    if (!first) res.append(", ");
    res.append(dev.ToJSON());
    first = false;
  }
  res.append("]}");
  return res;
}

Status DeviceConfig::Save(const std::string &path) const {
  const std::string tmp_path = path + ".tmp";
  const std::string data = ToJSON();
  FILE *fp = fopen(tmp_path.c_str(), "w");
  if (fp == nullptr) {
    return Errorf(STATUS_UNAVAILABLE, "%s: failed to open", tmp_path.c_str());
  }
  const bool ok = (fwrite(data.data(), 1, data.size(), fp) == data.size());
  if (fclose(fp) != 0 || !ok) {
    remove(tmp_path.c_str());
    return Errorf(STATUS_UNAVAILABLE, "%s: write failed", tmp_path.c_str());
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    remove(tmp_path.c_str());
    return Errorf(STATUS_UNAVAILABLE, "%s: rename failed", path.c_str());
  }
  LOG(LL_INFO, ("Saved %d devices to %s", (int) devices.size(), path.c_str()));
  return Status::OK();
}

DeviceConfig::Device *DeviceConfig::Find(Str id) {
  for (auto &dev : devices) {
    if (Str(dev.id) == id) return &dev;
  }
  return nullptr;
}

const DeviceConfig::Device *DeviceConfig::Find(Str id) const {
  for (const auto &dev : devices) {
    if (Str(dev.id) == id) return &dev;
  }
  return nullptr;
}

}  // namespace tpms
