#include "mediastream/catalog/memory_catalog.hpp"
#include "mediastream/server/router.hpp"
#include "mediastream/server/server.hpp"
#include "mediastream/service/media_service.hpp"
#include "mediastream/setting.hpp"
#include "mediastream/storage/fs_blob_store.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <csignal>
#include <spdlog/spdlog.h>

using namespace mediastream;

int main(int argc, char** argv)
{
    boost::system::error_code ec;

    setting conf;
    if (argc > 1) {
        conf = setting::load(argv[1], ec);
        if (ec) {
            spdlog::error("load setting {} failed: {}", argv[1], ec.message());
            return 1;
        }
    }

    boost::asio::thread_pool pool(conf.thread_count());
    try {
        server::http_server svr(pool.get_executor());
        auto logger = svr.get_logger();
        logger->set_level(spdlog::level::from_str(conf.log_level));

        storage::fs_blob_store store(conf.upload_dir);
        catalog::memory_catalog catalog(conf.catalog_path());
        catalog.load(ec);
        if (ec) {
            logger->error("load catalog {} failed: {}", conf.catalog_path().string(), ec.message());
            return 1;
        }
        logger->info("catalog has {} records, blobs in {}", catalog.size(), store.root().string());

        service::media_service api(catalog, store, conf, logger);
        api.register_routes(svr.router());

        server::connection_limits limits;
        limits.read_timeout  = conf.read_timeout;
        limits.write_timeout = conf.write_timeout;
        limits.body_limit    = conf.max_upload_size;
        svr.set_limits(limits);
        svr.listen(conf.host, conf.port);

        boost::asio::signal_set signals(pool, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
            if (error)
                return;
            logger->info("signal {} received, stopping", signal_number);
            svr.stop();
        });

        svr.async_run();
        pool.wait();
    }
    catch (const std::exception& e) {
        spdlog::error("mediastream stopped: {}", e.what());
        pool.stop();
        pool.join();
        return 1;
    }
    return 0;
}
