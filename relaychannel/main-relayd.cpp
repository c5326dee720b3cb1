// Copyright (C) 2026 The unite4 developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "relayserver.hpp"
#include "relaystore.hpp"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace
{

DEFINE_int32 (port, 0, "the port at which the relay's JSON-RPC server listens");
DEFINE_bool (listen_locally, true,
             "whether the JSON-RPC server should listen only on localhost");
DEFINE_int32 (poll_timeout_ms, 500,
              "how long a receive call waits for new events");

/** Set from the signal handler to request shutdown.  */
volatile std::sig_atomic_t shouldStop = 0;

void
HandleInterrupt (const int signum)
{
  shouldStop = 1;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run a unite4 relay server");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_port == 0)
    {
      std::cerr << "Error: --port must be set" << std::endl;
      return EXIT_FAILURE;
    }
  if (FLAGS_poll_timeout_ms <= 0)
    {
      std::cerr << "Error: --poll_timeout_ms must be positive" << std::endl;
      return EXIT_FAILURE;
    }

  jsonrpc::HttpServer httpServer(FLAGS_port);
  if (FLAGS_listen_locally)
    httpServer.BindLocalhost ();

  unite4::RelayStore store;
  unite4::RelayRpcServer rpcServer(
      store, std::chrono::milliseconds (FLAGS_poll_timeout_ms), httpServer);

  std::signal (SIGINT, &HandleInterrupt);
  std::signal (SIGTERM, &HandleInterrupt);

  LOG (INFO) << "Starting relay JSON-RPC server at port " << FLAGS_port;
  if (!rpcServer.StartListening ())
    {
      LOG (ERROR) << "Could not start the JSON-RPC server";
      return EXIT_FAILURE;
    }

  while (!shouldStop)
    std::this_thread::sleep_for (std::chrono::milliseconds (200));

  LOG (INFO) << "Stopping relay server with " << store.GetSequence ()
             << " stored events";
  rpcServer.StopListening ();

  return EXIT_SUCCESS;
}
