#include <lemu/emulator/server.hpp>

#include <lemu/common/util.hpp>

namespace lemu::emulator {

  std::shared_ptr<Server> Server::_instance = nullptr;

  Server::Server(config::Config& cfg)
      : _config(cfg), _workers(_config.workers), _discovery(_config),
        _builder(_config.build, _config.workspace),
        _registry(_config, _discovery, _builder, _launcher, _workers),
        _router(_registry), _runtime_api(_registry),
        _watcher(
            _config.watcher, _discovery,
            [this](const std::string& name) { _registry.invalidate_changed(name); },
            [this]() { _registry.invalidate_all(); }
        ),
        _http_server(std::make_shared<HttpServer>(_config.http, _runtime_api, _router, _registry))
  {
    _logger = common::util::create_logger("Server");
    _logger->info(
        "Workspace {}, Runtime API at {}", _config.workspace, _config.runtime_api_address()
    );
  }

  void Server::run()
  {
    _watcher.run();
    _http_server->run();
  }

  void Server::wait()
  {
    _http_server->wait();

    _watcher.shutdown();
    _watcher.wait();
    _registry.shutdown();
    _router.shutdown();
  }

  void Server::shutdown()
  {
    _http_server->shutdown();
  }

} // namespace lemu::emulator
