/*
 * Unit tests for src/ssdp_discovery.cpp
 */

#include "ssdp_discovery.hpp"
#include "upnp_extract.hpp"
#include "fake_transport.hpp"
#include "loopback.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

// Hands out queued answers one per wait, then stays silent for the whole slice
class scripted_source : public discovery::response_source
{
public:
	std::optional<discovery::datagram> wait(std::chrono::milliseconds slice) override
	{
		++waits;
		if(fail_after >= 0 && waits > fail_after)
			throw std::runtime_error {"Getting response failed"};

		if(answers.empty())
		{
			std::this_thread::sleep_for(silent_sleep ? slice : 0ms);
			return std::nullopt;
		}

		discovery::datagram d = std::move(answers.front());
		answers.pop_front();
		return d;
	}

	std::deque<discovery::datagram> answers;
	int waits = 0;
	int fail_after = -1;
	bool silent_sleep = false;
};

static const std::string tv_location = "http://10.0.0.5:49152/tv.xml";
static const std::string speaker_location = "http://10.0.0.6:1400/speaker.xml";

static upnp::description_fetcher
home_network()
{
	return fake_fetcher({
		{tv_location, description("Living Room TV")},
		{speaker_location, description("Kitchen Speaker")},
	});
}

static discovery::discover_options
short_timeout(std::string name = {})
{
	discovery::discover_options options;
	options.name = std::move(name);
	options.timeout = 50ms;
	return options;
}

TEST(SsdpDiscovery, MSearchRequest)
{
	EXPECT_EQ("M-SEARCH * HTTP/1.1\r\n"
		  "HOST: 239.255.255.250:1900\r\n"
		  "Accept: */*\r\n"
		  "MAN: \"ssdp:discover\"\r\n"
		  "ST: ssdp:all\r\n"
		  "MX: 3\r\n"
		  "\r\n",
		  discovery::msearch_request("ssdp:all", 3));
}

TEST(SsdpDiscovery, DuplicatesAreDropped)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer(tv_location), "10.0.0.5"},
		{ssdp_answer(tv_location), "10.0.0.5"},
		{ssdp_answer(speaker_location), "10.0.0.6"},
		{ssdp_answer(tv_location), "10.0.0.5"},
	};

	auto devices = discovery::collect(source, short_timeout(), home_network(),
					  std::make_shared<recording_sender>());

	ASSERT_EQ(2u, devices.size());
	EXPECT_EQ("Living Room TV", devices[0].name());
	EXPECT_EQ("Kitchen Speaker", devices[1].name());
}

TEST(SsdpDiscovery, NameFilter)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer(tv_location), "10.0.0.5"},
		{ssdp_answer(speaker_location), "10.0.0.6"},
	};

	auto devices = discovery::collect(source, short_timeout("TV"), home_network(),
					  std::make_shared<recording_sender>());

	ASSERT_EQ(1u, devices.size());
	EXPECT_EQ("Living Room TV", devices[0].name());
}

TEST(SsdpDiscovery, NameFilterIsCaseSensitive)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer(tv_location), "10.0.0.5"},
		{ssdp_answer(speaker_location), "10.0.0.6"},
	};

	auto devices = discovery::collect(source, short_timeout("tv"), home_network(),
					  std::make_shared<recording_sender>());

	EXPECT_TRUE(devices.empty());
}

TEST(SsdpDiscovery, UnreachableDeviceIsKept)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer("http://10.0.0.9/gone.xml"), "10.0.0.9"},
		{ssdp_answer(tv_location), "10.0.0.5"},
	};

	auto devices = discovery::collect(source, short_timeout(), home_network(),
					  std::make_shared<recording_sender>());

	ASSERT_EQ(2u, devices.size());
	EXPECT_EQ("10.0.0.9", devices[0].ip());
	EXPECT_FALSE(devices[0].has_av_transport());
	EXPECT_EQ("", devices[0].control_url());
	EXPECT_TRUE(devices[1].has_av_transport());
}

TEST(SsdpDiscovery, SocketErrorAborts)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer(tv_location), "10.0.0.5"},
	};
	source.fail_after = 1;

	EXPECT_THROW(discovery::collect(source, short_timeout(), home_network(),
					std::make_shared<recording_sender>()),
		     std::runtime_error);
}

TEST(SsdpDiscovery, ReturnsAfterTimeout)
{
	scripted_source source;
	source.silent_sleep = true;

	discovery::discover_options options;
	options.timeout = 1500ms;

	const auto start = std::chrono::steady_clock::now();
	auto devices = discovery::collect(source, options, home_network(),
					  std::make_shared<recording_sender>());
	const auto elapsed = std::chrono::steady_clock::now() - start;

	EXPECT_TRUE(devices.empty());
	EXPECT_GE(elapsed, 1500ms);
	EXPECT_LT(elapsed, 1500ms + std::chrono::milliseconds {DISCOVERY_SLICE} + 500ms);
}

TEST(SsdpDiscovery, ZeroTimeoutWaitsOnce)
{
	scripted_source source;
	source.answers = {
		{ssdp_answer(tv_location), "10.0.0.5"},
	};

	discovery::discover_options options;
	options.timeout = 0ms;

	auto devices = discovery::collect(source, options, home_network(),
					  std::make_shared<recording_sender>());

	EXPECT_EQ(1, source.waits);
	ASSERT_EQ(1u, devices.size());
	EXPECT_EQ("Living Room TV", devices[0].name());
}

TEST(SsdpDiscovery, ParseTimeout)
{
	EXPECT_EQ(500ms, discovery::parse_timeout("0.5"));
	EXPECT_EQ(3000ms, discovery::parse_timeout("3"));
	EXPECT_EQ(0ms, discovery::parse_timeout("0"));
	EXPECT_EQ(1ms, discovery::parse_timeout("0.0001"));
	EXPECT_EQ(86400000ms, discovery::parse_timeout("86400"));
}

TEST(SsdpDiscovery, ParseTimeoutRejects)
{
	EXPECT_THROW(discovery::parse_timeout(""), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("abc"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("5abc"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("-1"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("inf"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("nan"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("1e300"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("1e400"), std::invalid_argument);
	EXPECT_THROW(discovery::parse_timeout("86401"), std::invalid_argument);
}

TEST(SsdpDiscovery, SocketSourceTimesOut)
{
	discovery::socket_source source {transport::udp_socket {"127.0.0.1", 0}};

	EXPECT_FALSE(source.wait(100ms));
}

// Answers larger than 1024 bytes are read completely
TEST(SsdpDiscovery, SocketSourceReadsLargeAnswer)
{
	transport::udp_socket receiver {"127.0.0.1", 0};
	const uint16_t port = local_port(receiver.get());
	discovery::socket_source source {std::move(receiver)};

	std::string answer = ssdp_answer(tv_location);
	answer.insert(answer.size() - 2, "X-PADDING: " + std::string(2000, 'x') + "\r\n");
	ASSERT_GT(answer.size(), 1024u);
	ASSERT_LE(answer.size(), static_cast<size_t>(MAX_RESPONSE_SIZE));

	transport::udp_socket sender {"127.0.0.1", 0};
	sender.send("127.0.0.1", port, answer);

	auto received = source.wait(1000ms);
	ASSERT_TRUE(received);
	EXPECT_EQ(answer, received->payload);
	EXPECT_EQ("127.0.0.1", received->sender);
	EXPECT_EQ(tv_location, upnp::extract_location(received->payload));
}
