#ifndef BOOST_TEST_MODULE
#	define BOOST_TEST_MODULE limit_tests
#	define BOOST_TEST_DYN_LINK
#	include <boost/test/unit_test.hpp>
#endif /* BOOST_TEST_MODULE */

#include <motdcast/networking/motd_announcer.hpp>
#include "datagram_sink.hpp"
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace motdcast::networking;

BOOST_AUTO_TEST_SUITE(basic_limits)

BOOST_AUTO_TEST_CASE(test_many_announcers)
{
	datagram_sink sink;

	unsigned short port = 25565;
	std::vector<std::unique_ptr<motd_announcer>> announcers;
	for (int i = 0; i != 16; ++i)
	{
		announcers.emplace_back(new motd_announcer(
			"Server", port++, std::chrono::milliseconds(100), sink.port(), sink.address()));
	}

	for (auto& announcer : announcers)
		announcer->start();

	BOOST_CHECK(sink.wait_for(announcers.size() * 2, std::chrono::seconds(2)));

	for (auto& announcer : announcers)
		announcer->stop();

	std::set<std::string> bodies;
	for (const auto& datagram : sink.datagrams())
		bodies.insert(datagram.body);

	BOOST_CHECK_EQUAL(bodies.size(), announcers.size());
	BOOST_CHECK(bodies.count("[MOTD]Server[/MOTD][AD]25565[/AD]"));
	BOOST_CHECK(bodies.count("[MOTD]Server[/MOTD][AD]25580[/AD]"));
}

BOOST_AUTO_TEST_CASE(test_overflow)
{
	std::string ridiculously_long_motd;
	const char hex_chars[] = "0123456789abcdef";

	for (int i = 0; i != 1024 * 8; ++i)
	{
		ridiculously_long_motd.push_back(hex_chars[i % (sizeof(hex_chars) - 1)]);
	}

	datagram_sink sink;
	motd_announcer announcer(ridiculously_long_motd, 65535, std::chrono::seconds(1), sink.port(), sink.address());

	announcer.start();
	BOOST_REQUIRE(sink.wait_for(1, std::chrono::seconds(1)));
	announcer.stop();

	BOOST_CHECK_EQUAL(sink.datagrams().front().body, "[MOTD]" + ridiculously_long_motd + "[/MOTD][AD]65535[/AD]");
}

BOOST_AUTO_TEST_CASE(test_utf8_motd)
{
	datagram_sink sink;
	motd_announcer announcer("\xe6\x9c\x8d\xe5\x8a\xa1\xe5\x99\xa8 1 \xc2\xa7" "a", 25565,
		std::chrono::seconds(1), sink.port(), sink.address());

	announcer.start();
	BOOST_REQUIRE(sink.wait_for(1, std::chrono::seconds(1)));
	announcer.stop();

	BOOST_CHECK_EQUAL(sink.datagrams().front().body,
		"[MOTD]\xe6\x9c\x8d\xe5\x8a\xa1\xe5\x99\xa8 1 \xc2\xa7" "a[/MOTD][AD]25565[/AD]");
}

BOOST_AUTO_TEST_CASE(test_whitespace_only_motd)
{
	motd_announcer announcer(" \t\r\n ", 25565);
	BOOST_CHECK_EQUAL(announcer.motd(), "");
	BOOST_CHECK_EQUAL(announcer.message(), "[MOTD][/MOTD][AD]25565[/AD]");
}

// start and stop in quick succession must never leave a second timeline behind
BOOST_AUTO_TEST_CASE(test_rapid_restart)
{
	datagram_sink sink;
	motd_announcer announcer("Test Server", 25565, std::chrono::seconds(10), sink.port(), sink.address());

	for (int i = 0; i != 50; ++i)
	{
		announcer.start();
		announcer.stop();
	}

	announcer.start();
	BOOST_REQUIRE(sink.wait_for(1, std::chrono::seconds(1)));
	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	const std::size_t received = sink.size();
	std::this_thread::sleep_for(std::chrono::milliseconds(300));
	announcer.stop();

	BOOST_CHECK_EQUAL(sink.size(), received);
	BOOST_CHECK_LE(announcer.sent_count(), 51u);
}

BOOST_AUTO_TEST_CASE(test_short_interval)
{
	datagram_sink sink;
	motd_announcer announcer("Test Server", 25565, std::chrono::milliseconds(1), sink.port(), sink.address());

	announcer.start();
	BOOST_CHECK(sink.wait_for(20, std::chrono::seconds(2)));
	announcer.stop();

	const std::size_t sent = announcer.sent_count();
	BOOST_CHECK(sink.wait_for(sent, std::chrono::seconds(1)));
	std::this_thread::sleep_for(std::chrono::milliseconds(100));
	BOOST_CHECK_EQUAL(sink.size(), sent);
}

BOOST_AUTO_TEST_SUITE_END()
