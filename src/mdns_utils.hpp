#pragma once

#include "mdns.h"
#include "mdns_scan/log.hpp"
#include "mdns_scan/types.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace mdns_scan
{

// Socket setup and record parsing follow mdns.c from the mdns library

inline EntryType ParseEntryType(mdns_entry_type_t entry_type) {
	switch (entry_type) {
		case MDNS_ENTRYTYPE_QUESTION : return EntryType::QUESTION;
		case MDNS_ENTRYTYPE_ANSWER : return EntryType::ANSWER;
		case MDNS_ENTRYTYPE_AUTHORITY : return EntryType::AUTHORITY;
		case MDNS_ENTRYTYPE_ADDITIONAL : return EntryType::ADDITIONAL;
	}
	return EntryType::UNKNOWN;
}

// Numeric "host:port" text for a packet source, "[host]:port" for IPv6
inline std::string SocketAddressToString(const sockaddr* addr, size_t addrlen) {
	char host[NI_MAXHOST] = {0};
	char service[NI_MAXSERV] = {0};
	if (getnameinfo(addr, static_cast<socklen_t>(addrlen), host, NI_MAXHOST, service, NI_MAXSERV,
	                NI_NUMERICSERV | NI_NUMERICHOST) != 0) {
		return "";
	}
	const bool v6 = addr->sa_family == AF_INET6;
	const auto port = v6 ? reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port
	                     : reinterpret_cast<const sockaddr_in*>(addr)->sin_port;
	if (port == 0) {
		return host;
	}
	return v6 ? fmt::format("[{}]:{}", host, service) : fmt::format("{}:{}", host, service);
}

inline Ipv4Address ToIpv4Address(const sockaddr_in& addr) {
	Ipv4Address address;
	std::memcpy(address.octets.data(), &addr.sin_addr.s_addr, address.octets.size());
	return address;
}

inline Ipv6Address ToIpv6Address(const sockaddr_in6& addr) {
	Ipv6Address address;
	std::memcpy(address.octets.data(), addr.sin6_addr.s6_addr, address.octets.size());
	return address;
}

// One socket per interface and address family, since a socket only sends on one interface
inline std::vector<int> OpenClientSockets(int port, std::size_t max_sockets) {
	std::vector<int> sockets;

	struct ifaddrs* ifaddr = nullptr;
	if (getifaddrs(&ifaddr) < 0) {
		Log(LogLevel::Warn, "Unable to get interface addresses");
		return sockets;
	}

	for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
		if (!ifa->ifa_addr)
			continue;
		if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
			continue;
		if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
			continue;
		if (sockets.size() >= max_sockets)
			break;

		if (ifa->ifa_addr->sa_family == AF_INET) {
			struct sockaddr_in* saddr = (struct sockaddr_in*)ifa->ifa_addr;
			if (saddr->sin_addr.s_addr == htonl(INADDR_LOOPBACK))
				continue;

			saddr->sin_port = htons(port);
			int sock = mdns_socket_open_ipv4(saddr);
			if (sock >= 0) {
				sockets.push_back(sock);
				Log(LogLevel::Debug, fmt::format("Socket opened on {} with local IPv4 address: {}", ifa->ifa_name, SocketAddressToString(ifa->ifa_addr, sizeof(struct sockaddr_in))));
			}
		} else if (ifa->ifa_addr->sa_family == AF_INET6) {
			struct sockaddr_in6* saddr = (struct sockaddr_in6*)ifa->ifa_addr;
			// Ignore link-local addresses
			if (saddr->sin6_scope_id)
				continue;
			const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                   0, 0, 0, 0, 0, 0, 0, 1};
			const unsigned char localhost_mapped[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                          0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
			if (!memcmp(saddr->sin6_addr.s6_addr, localhost, 16) ||
			    !memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16))
				continue;

			saddr->sin6_port = htons(port);
			int sock = mdns_socket_open_ipv6(saddr);
			if (sock >= 0) {
				sockets.push_back(sock);
				Log(LogLevel::Debug, fmt::format("Socket opened on {} with local IPv6 address: {}", ifa->ifa_name, SocketAddressToString(ifa->ifa_addr, sizeof(struct sockaddr_in6))));
			}
		}
	}

	freeifaddrs(ifaddr);
	return sockets;
}

// Collects every resource record of one received packet into the Response passed as user_data
inline int QueryCallback(int sock, const struct sockaddr* from, size_t addrlen,
                        mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                        uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                        size_t name_offset, size_t name_length, size_t record_offset,
                        size_t record_length, void* user_data)
{
	(void)sock;
	(void)query_id;
	(void)name_length;

	if (entry == MDNS_ENTRYTYPE_QUESTION) {
		return 0;
	}

	auto response = reinterpret_cast<Response*>(user_data);
	if (response->FromAddress().empty()) {
		response->SetFromAddress(SocketAddressToString(from, addrlen));
	}

	RecordHeader header;
	header.from_address = response->FromAddress();
	header.entry_type = ParseEntryType(entry);
	char entrybuffer[256];
	const mdns_string_t entrystr = mdns_string_extract(data, size, &name_offset, entrybuffer, sizeof(entrybuffer));
	header.name = std::string(entrystr.str, entrystr.length);
	header.record_type = rtype;
	header.rclass = rclass;
	header.ttl = ttl;
	header.record_length = record_length;

	if (rtype == MDNS_RECORDTYPE_PTR) {
		DomainNamePointerRecord ptrRecord;
		ptrRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_string_t namestr = mdns_record_parse_ptr(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		ptrRecord.target = std::string(namestr.str, namestr.length);
		response->AddRecord(std::move(ptrRecord));
	} else if (rtype == MDNS_RECORDTYPE_SRV) {
		ServiceRecord srvRecord;
		srvRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		srvRecord.target = std::string(srv.name.str, srv.name.length);
		srvRecord.priority = srv.priority;
		srvRecord.weight = srv.weight;
		srvRecord.port = srv.port;
		response->AddRecord(std::move(srvRecord));
	} else if (rtype == MDNS_RECORDTYPE_A && record_length == 4) {
		ARecord aRecord;
		aRecord.header = std::move(header);

		struct sockaddr_in addr;
		mdns_record_parse_a(data, size, record_offset, record_length, &addr);
		aRecord.address = ToIpv4Address(addr);
		response->AddRecord(std::move(aRecord));
	} else if (rtype == MDNS_RECORDTYPE_AAAA && record_length == 16) {
		AAAARecord aaaaRecord;
		aaaaRecord.header = std::move(header);

		struct sockaddr_in6 addr;
		mdns_record_parse_aaaa(data, size, record_offset, record_length, &addr);
		aaaaRecord.address = ToIpv6Address(addr);
		response->AddRecord(std::move(aaaaRecord));
	} else if (rtype == MDNS_RECORDTYPE_TXT) {
		TXTRecord txtRecord;
		txtRecord.header = std::move(header);

		mdns_record_txt_t txtbuffer[128];
		const size_t parsed = mdns_record_parse_txt(data, size, record_offset, record_length, txtbuffer,
		                                            sizeof(txtbuffer) / sizeof(mdns_record_txt_t));
		for (size_t itxt = 0; itxt < parsed; ++itxt) {
			txtRecord.txt.emplace_back(std::string(txtbuffer[itxt].key.str, txtbuffer[itxt].key.length),
			                           std::string(txtbuffer[itxt].value.str, txtbuffer[itxt].value.length));
		}
		response->AddRecord(std::move(txtRecord));
	} else {
		// Includes A/AAAA records with a bad length
		AnyRecord anyRecord;
		anyRecord.header = std::move(header);
		response->AddRecord(std::move(anyRecord));
	}

	return 0;
}

// Reads one packet from sock. An empty Response means nothing in it decoded.
inline Response ReceiveResponse(int sock, void* buffer, size_t capacity) {
	Response response;
	mdns_query_recv(sock, buffer, capacity, QueryCallback, &response, 0);
	for (const auto& record : response.AnswerRecords()) {
		Log(LogLevel::Debug, fmt::format("{}", fmt::streamed(record)));
	}
	return response;
}

// Sends a PTR query for name on every socket and returns how many sends succeeded.
// last_error keeps the errno of the last failed send.
inline std::size_t SendPtrQuery(const std::vector<int>& sockets, const std::string& name,
                                void* buffer, size_t capacity, int& last_error) {
	std::size_t sent = 0;
	for (const auto sock : sockets) {
		if (mdns_query_send(sock, MDNS_RECORDTYPE_PTR, name.data(), name.size(), buffer, capacity, 0) >= 0) {
			++sent;
			continue;
		}
		const int error = errno;
		last_error = error;
		Log(LogLevel::Debug, fmt::format("Failed to send mDNS query on socket {}: {}", sock, strerror(error)));
	}
	return sent;
}

}
