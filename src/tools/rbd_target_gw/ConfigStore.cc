// -*- mode:C++; tab-width:8; c-basic-offset:2; indent-tabs-mode:t -*-
// vim: ts=8 sw=2 smarttab

#include "tools/rbd_target_gw/ConfigStore.h"
#include "tools/rbd_target_gw/Log.h"

#include <cerrno>
#include <set>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#undef dout_prefix
#define dout_prefix *_dout << "rbd::target_gw::ConfigStore: " << __func__ \
                           << ": "

namespace rbd {
namespace target_gw {

namespace pt = boost::property_tree;

namespace {

// scalar keys of the gateways section that are not host entries
const std::set<std::string> GATEWAY_KEYS = {
  "ip_list", "iqn", "created", "updated"};

bool is_array(const pt::ptree& node) {
  if (node.empty() || !node.data().empty()) {
    return false;
  }
  for (auto& [key, child] : node) {
    if (!key.empty()) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> decode_string_list(const pt::ptree& node) {
  std::vector<std::string> values;
  for (auto& [key, child] : node) {
    values.push_back(child.data());
  }
  return values;
}

void decode_host(const pt::ptree& node, GatewayHost* host) {
  host->portal_ip_address = node.get<std::string>("portal_ip_address", "");
  host->iqn = node.get<std::string>("iqn", "");
  host->tpgs = node.get<uint32_t>("tpgs", 0);
  host->active_luns = node.get<uint32_t>("active_luns", 0);

  auto ips = node.get_child_optional("gateway_ip_list");
  if (ips) {
    host->gateway_ip_list = decode_string_list(*ips);
  }
  auto inactive = node.get_child_optional("inactive_portal_ips");
  if (inactive) {
    host->inactive_portal_ips = decode_string_list(*inactive);
  }
}

int decode_gateways(const pt::ptree& node, GatewaysSection* gateways,
                    std::string* err) {
  for (auto& [key, child] : node) {
    if (key == "ip_list") {
      if (!child.empty() && !is_array(child)) {
        *err = "gateways.ip_list is not a list";
        return -EINVAL;
      }
      gateways->ip_list = decode_string_list(child);
    } else if (key == "iqn") {
      gateways->iqn = child.data();
    } else if (GATEWAY_KEYS.count(key) != 0) {
      continue;
    } else if (child.empty()) {
      ldout(20) << "ignoring scalar gateways key '" << key << "'" << dendl;
    } else {
      decode_host(child, &gateways->hosts[key]);
    }
  }
  return 0;
}

int decode_disks(const pt::ptree& node,
                 std::map<std::string, DiskConfig>* disks,
                 std::string* err) {
  for (auto& [key, child] : node) {
    DiskConfig disk;
    auto pos = key.find('.');
    disk.pool = child.get<std::string>("pool",
                                       key.substr(0, pos));
    disk.image = child.get<std::string>(
      "image", pos == std::string::npos ? "" : key.substr(pos + 1));
    disk.dm_device = child.get<std::string>("dm_device", "");
    disk.owner = child.get<std::string>("owner", "");
    disk.wwn = child.get<std::string>("wwn", "");

    if (disk.pool.empty() || disk.image.empty()) {
      *err = "disk '" + key + "' does not name a pool and image";
      return -EINVAL;
    }
    (*disks)[key] = disk;
  }
  return 0;
}

void decode_clients(const pt::ptree& node,
                    std::map<std::string, ClientConfig>* clients) {
  for (auto& [iqn, child] : node) {
    ClientConfig client;
    client.chap = child.get<std::string>("auth.chap", "");

    auto luns = child.get_child_optional("luns");
    if (luns) {
      if (is_array(*luns)) {
        for (auto& [_, lun] : *luns) {
          client.luns[lun.data()] = -1;
        }
      } else {
        for (auto& [disk, lun] : *luns) {
          client.luns[disk] = lun.get<int>("lun_id", -1);
        }
      }
    }
    (*clients)[iqn] = client;
  }
}

} // anonymous namespace

int decode_shared_config(const std::string& json, SharedConfig* config,
                         std::string* err) {
  pt::ptree root;
  try {
    std::istringstream iss(json);
    pt::read_json(iss, root);
  } catch (const pt::json_parser_error& e) {
    *err = std::string("malformed configuration object: ") + e.what();
    return -EINVAL;
  }

  if (is_array(root)) {
    *err = "configuration object is not a JSON object";
    return -EINVAL;
  }

  SharedConfig decoded;
  try {
    decoded.epoch = root.get<uint64_t>("epoch", 0);

    auto gateways = root.get_child_optional("gateways");
    if (gateways) {
      decoded.has_gateways = true;
      int r = decode_gateways(*gateways, &decoded.gateways, err);
      if (r < 0) {
        return r;
      }
    }

    auto disks = root.get_child_optional("disks");
    if (disks) {
      int r = decode_disks(*disks, &decoded.disks, err);
      if (r < 0) {
        return r;
      }
    }

    auto clients = root.get_child_optional("clients");
    if (clients) {
      decode_clients(*clients, &decoded.clients);
    }
  } catch (const pt::ptree_error& e) {
    *err = std::string("invalid configuration object: ") + e.what();
    return -EINVAL;
  }

  ldout(20) << "epoch=" << decoded.epoch << ", "
            << "hosts=" << decoded.gateways.hosts.size() << ", "
            << "disks=" << decoded.disks.size() << ", "
            << "clients=" << decoded.clients.size() << dendl;
  *config = std::move(decoded);
  return 0;
}

} // namespace target_gw
} // namespace rbd
