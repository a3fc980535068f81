#include "feedweave/common/datum.inline.hpp"
#include "feedweave/engine/feed_engine.hpp"
#include "feedweave/sources/location_source.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <boost/asio/io_context.hpp>

namespace
{

using namespace feedweave;

/**
 * @brief Item payload of DaylightSource.
 */
struct DaylightReport
{
    bool daytime;
    std::string text;
};

/**
 * @brief Derives a rough day/night item from the location's longitude.
 */
class DaylightSource : public IFeedSource
{
public:
    const std::string& id() const override
    {
        return m_id;
    }

    std::vector<std::string> dependencies() const override
    {
        return {LocationSource::kDefaultId};
    }

    SourceCapability capabilities() const override
    {
        return SourceCapability::FetchItems;
    }

    std::vector<FeedItem> fetch_items(const Context& context) override
    {
        const Location* location = context.value(kLocationKey);
        if (!location)
        {
            return {};
        }

        // Solar time from UTC plus 4 minutes per degree of longitude.
        const auto since_epoch = context.time().time_since_epoch();
        const double utc_hours = std::fmod(
            std::chrono::duration<double, std::ratio<3600>>(since_epoch).count(), 24.0);
        double solar_hours = std::fmod(utc_hours + location->lng / 15.0, 24.0);
        if (solar_hours < 0.0)
        {
            solar_hours += 24.0;
        }
        const bool daytime = solar_hours >= 6.0 && solar_hours < 18.0;

        FeedItem item;
        item.id = "daylight-now";
        item.type = "daylight";
        item.timestamp = context.time();
        item.data = Datum::of(DaylightReport{
            daytime,
            std::string(daytime ? "Daytime" : "Night-time") + " at (" +
                std::to_string(location->lat) + ", " + std::to_string(location->lng) + ")"});
        item.signals = FeedItemSignals{0.2, TimeRelevance::Ambient};
        return {item};
    }

private:
    std::string m_id{"feedweave.daylight"};
};

void print_feed(const FeedResultPtr& result)
{
    std::cout << result->summary() << "\n";
    for (const auto& item : result->items)
    {
        std::cout << "  [" << item.type << "] " << item.id;
        if (const auto* report = item.data.try_as<DaylightReport>())
        {
            std::cout << ": " << report->text;
        }
        std::cout << "\n";
    }
    for (const auto& error : result->errors)
    {
        std::cout << "  error from " << error.source_id << ": " << error.message << "\n";
    }
    std::cout << std::flush;
}

} // namespace

int main(int argc, char** argv)
{
    (void)argc;
    (void)argv;
    try
    {
        std::cout << "\n\n====== feedweave ======\n" << std::flush;

        boost::asio::io_context io;

        FeedEngineConfig config;
        config.log_sink = std::make_shared<StreamLogSink>(std::clog, LogLevel::Info);
        auto engine = make_feed_engine(io, config);

        auto location = std::make_shared<LocationSource>();
        engine->register_source(location);
        engine->register_source(std::make_shared<DaylightSource>());

        std::cout << "\n-- pull refresh before any location --\n";
        print_feed(engine->refresh());

        Unsubscribe unsubscribe = engine->subscribe(print_feed);
        engine->start();

        std::cout << "\n-- update-location action --\n";
        engine->execute_action(location->id(), LocationSource::kUpdateLocationAction,
                               Datum::of(Location{51.5074, -0.1278, 25.0, Clock::now()}));
        io.poll();

        std::cout << "\n-- pushed location --\n";
        location->push_location(Location{35.6762, 139.6503, 10.0, Clock::now()});
        io.restart();
        io.poll();

        unsubscribe();
        engine->stop();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
