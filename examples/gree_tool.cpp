/*
 *  Low level tool for local Gree client
 *
 *  Talks to the protocol layer directly, without registry or session
 *  management. Useful to find out what lives on the network and to replay
 *  single requests.
 *
 *   gree_tool scan [broadcast]
 *   gree_tool bind <ip> <mac>
 *   gree_tool get <ip> <mac> <key> NAME [NAME..]
 *   gree_tool set <ip> <mac> <key> NAME=VALUE [NAME=VALUE..]
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef BROADCAST_ADDRESS
#define BROADCAST_ADDRESS "10.0.0.255"
#endif

#ifndef MAX_DEVICES
#define MAX_DEVICES 10
#endif

#include "greeAPI.hpp"
#include "greeVars.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>


void usage(const char *name)
{
	fprintf(stderr, "usage %s scan [broadcast]\n", name);
	fprintf(stderr, "      %s bind <ip> <mac>\n", name);
	fprintf(stderr, "      %s get <ip> <mac> <key> NAME [NAME..]\n", name);
	fprintf(stderr, "      %s set <ip> <mac> <key> NAME=VALUE [NAME=VALUE..]\n", name);
	exit(1);
}


int fail(greeAPI &client, const std::string &action)
{
	std::cout << "Error: " << action << " failed: " << Gree::Error::name(client.getlasterror());
	if (!client.getlasterrordetail().empty())
		std::cout << " (" << client.getlasterrordetail() << ")";
	std::cout << "\n";
	return 1;
}


int main(int argc, char *argv[])
{
	std::cout.setf(std::ios::unitbuf);  // Unbuffered output

	if (argc < 2)
		usage(argv[0]);
	std::string command = argv[1];

	greeAPI client;
	if (!client.Open())
	{
		std::cout << "Error: no socket available\n";
		return 1;
	}

	if (command == "scan")
	{
		std::string broadcast = (argc > 2) ? argv[2] : BROADCAST_ADDRESS;
		std::vector<greeScanResult> results;
		if (!client.Scan(broadcast, MAX_DEVICES, results))
			return fail(client, "scan");

		for (size_t i = 0; i < results.size(); i++)
		{
			std::cout << results[i].address << "\t" << results[i].mac << "\t"
			          << results[i].pack["name"].asString() << "\t" << results[i].pack["ver"].asString() << "\n";
		}
		std::cout << results.size() << " device(s) found\n";
		return 0;
	}

	if (command == "bind")
	{
		if (argc < 4)
			usage(argv[0]);
		greeBindResponse response;
		if (!client.Bind(argv[2], argv[3], response))
			return fail(client, "bind");
		std::cout << "key: " << response.key << "\n";
		return 0;
	}

	if (argc < 6)
		usage(argv[0]);
	std::string address = argv[2];
	std::string mac = argv[3];
	std::string key = argv[4];

	if (command == "get")
	{
		std::vector<std::string> names;
		for (int i = 5; i < argc; i++)
			names.push_back(argv[i]);

		greeVarBag bag;
		if (!bag.FromNames(names))
		{
			std::cout << "Error: unknown variable " << bag.getlasterrordetail() << "\n";
			return 1;
		}

		greeStatusResponse response;
		if (!client.GetVars(address, mac, key, bag.PendingReads(), response))
			return fail(client, "status");
		for (size_t i = 0; (i < response.cols.size()) && (i < response.dat.size()); i++)
			bag.ApplyReadResult(response.cols[i], response.dat[i]);

		Json::StreamWriterBuilder jBuilder;
		jBuilder["indentation"] = "  ";
		std::cout << Json::writeString(jBuilder, bag.ToReportMap()) << "\n";
		return 0;
	}

	if (command == "set")
	{
		std::vector<std::pair<std::string, std::string> > pairs;
		for (int i = 5; i < argc; i++)
		{
			std::string arg = argv[i];
			size_t pos = arg.find('=');
			if (pos == std::string::npos)
				usage(argv[0]);
			pairs.push_back(std::make_pair(arg.substr(0, pos), arg.substr(pos + 1)));
		}

		greeVarBag bag;
		if (!bag.FromNameValuePairs(pairs))
		{
			std::cout << "Error: " << Gree::Error::name(bag.getlasterror()) << " " << bag.getlasterrordetail() << "\n";
			return 1;
		}

		std::vector<std::pair<std::string, Json::Value> > writes = bag.PendingWrites();
		std::vector<std::string> names;
		std::vector<Json::Value> values;
		for (size_t i = 0; i < writes.size(); i++)
		{
			names.push_back(writes[i].first);
			values.push_back(writes[i].second);
		}

		greeCommandResponse response;
		if (!client.SetVars(address, mac, key, names, values, response))
			return fail(client, "command");
		for (size_t i = 0; (i < response.opt.size()) && (i < response.p.size()); i++)
			std::cout << response.opt[i] << " = " << response.p[i].toStyledString();
		return 0;
	}

	usage(argv[0]);
	return 1;
}
