#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "warden/admission.hpp"
#include "warden/config.hpp"
#include "warden/version.hpp"

namespace {

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

void print_error(const std::string &code, const std::string &detail) {
  std::cerr << "{\"error\":\"" << code << "\",\"detail\":\"" << detail
            << "\"}\n";
}

void usage() {
  std::cerr << "usage: warden config [--json FILE]\n"
               "       warden simulate [--json FILE] [--tenants N] "
               "[--tasks M] [--fail-rate P] [--threads T]\n"
               "       warden version\n";
}

// Defaults, then --json FILE, then WARDEN_* environment. Returns false and
// prints the error when the file cannot be used.
bool load_config(int argc, char **argv, warden::ControlPlaneConfig *cfg) {
  *cfg = warden::default_config();
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == "--json" && i + 1 < argc) {
      const std::string path = argv[++i];
      std::string doc;
      if (!read_file(path, &doc)) {
        print_error("config_unreadable", path);
        return false;
      }
      std::string err;
      *cfg = warden::config_from_json(doc, *cfg, &err);
      if (!err.empty()) {
        print_error("invalid_config", err);
        return false;
      }
    }
  }
  *cfg = warden::config_from_env(*cfg);
  return true;
}

int cmd_config(int argc, char **argv) {
  warden::ControlPlaneConfig cfg;
  if (!load_config(argc, argv, &cfg))
    return 1;
  const auto v = warden::validate_config(cfg);
  std::cout << "{\"config\":" << warden::config_to_json(cfg)
            << ",\"validation\":" << v.to_json() << "}\n";
  return v.ok ? 0 : 2;
}

int cmd_simulate(int argc, char **argv) {
  warden::ControlPlaneConfig cfg;
  if (!load_config(argc, argv, &cfg))
    return 1;

  int tenants = 4;
  int tasks = 200;
  int threads = 4;
  double fail_rate = 0.05;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--tenants" && i + 1 < argc)
      tenants = std::atoi(argv[++i]);
    else if (a == "--tasks" && i + 1 < argc)
      tasks = std::atoi(argv[++i]);
    else if (a == "--threads" && i + 1 < argc)
      threads = std::atoi(argv[++i]);
    else if (a == "--fail-rate" && i + 1 < argc)
      fail_rate = std::atof(argv[++i]);
  }
  if (tenants < 1 || tasks < 0 || threads < 1 || fail_rate < 0.0 ||
      fail_rate > 1.0) {
    print_error("invalid_argument",
                "tenants>=1, tasks>=0, threads>=1, 0<=fail-rate<=1");
    return 1;
  }

  const auto v = warden::validate_config(cfg);
  if (!v.ok) {
    std::cerr << v.to_json() << "\n";
    return 2;
  }

  warden::AdmissionController controller(cfg);
  for (int t = 0; t < tenants; ++t) {
    warden::TenantConfig tc = cfg.default_tenant;
    tc.tenant_id = "tenant-" + std::to_string(t);
    // Two tiers: even tenants outrank odd ones.
    tc.priority = (t % 2 == 0) ? 10 : 0;
    tc.max_queue_size = std::max(1, threads / 2);
    if (!controller.register_tenant(tc).ok()) {
      print_error("invalid_config", tc.tenant_id);
      return 1;
    }
  }
  controller.start();

  std::atomic<int> next{0};
  std::vector<std::thread> pool;
  for (int w = 0; w < threads; ++w) {
    pool.emplace_back([&, w] {
      std::mt19937 rng(static_cast<unsigned>(w) * 7919u + 1u);
      std::uniform_real_distribution<double> coin(0.0, 1.0);
      for (int n = next.fetch_add(1); n < tasks; n = next.fetch_add(1)) {
        warden::TenantInfoPtr tenant = controller.schedule();
        if (!tenant)
          break;
        warden::TaskContext ctx(tenant->id());
        ctx.request_id = "req-" + std::to_string(n);

        warden::TaskSpec task;
        task.task_id = "task-" + std::to_string(n);
        task.task_type = (n % 3 == 0) ? "io" : "compute";
        task.payload = "{\"n\":" + std::to_string(n) + "}";
        const bool fail = coin(rng) < fail_rate;
        task.fn = [fail](const warden::TaskContext &) {
          std::this_thread::sleep_for(std::chrono::microseconds(200));
          if (fail)
            return warden::Status::failure(warden::ErrorCode::execution_failed,
                                           "simulated failure");
          return warden::Status::success();
        };
        // Rejections are part of the workload; the snapshot counts them.
        warden::Status s = controller.execute(ctx, task);
        if (s.code == warden::ErrorCode::quota_exceeded ||
            s.code == warden::ErrorCode::throttled)
          std::this_thread::yield();
      }
    });
  }
  for (auto &t : pool)
    t.join();

  controller.stop();
  controller.dispatcher()->flush();
  std::cout << controller.snapshot_json(0) << "\n";
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    usage();
    return 1;
  }

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(
                     warden::version::current_manifest())
              << "\n";
    return 0;
  }
  if (cmd == "config")
    return cmd_config(argc, argv);
  if (cmd == "simulate")
    return cmd_simulate(argc, argv);

  usage();
  return 1;
}
