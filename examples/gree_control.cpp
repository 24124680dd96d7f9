/*
 *  Get/set example for local Gree client
 *
 *  Addresses devices by MAC or by an alias from the configuration file and
 *  leaves scanning and binding to the client.
 *
 *   gree_control list
 *   gree_control get <mac|alias> NAME [NAME..]
 *   gree_control set <mac|alias> NAME=VALUE [NAME=VALUE..]
 *
 *  Prints the variables as JSON. The exit code follows the HTTP status a
 *  web front end would answer with: 0 on success, else status / 100.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeClient.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>


void usage(const char *name)
{
	fprintf(stderr, "usage %s list\n", name);
	fprintf(stderr, "      %s get <mac|alias> NAME [NAME..]\n", name);
	fprintf(stderr, "      %s set <mac|alias> NAME=VALUE [NAME=VALUE..]\n", name);
	exit(1);
}


int report_error(const Gree::Error::value error, const std::string &detail)
{
	int status = Gree::Error::http_status(error);
	Json::Value jError;
	jError["status"] = status;
	jError["error"] = Gree::Error::name(error);
	if (!detail.empty())
		jError["detail"] = detail;
	Json::StreamWriterBuilder jBuilder;
	std::cout << Json::writeString(jBuilder, jError) << "\n";
	return status / 100;
}


void print_device(const greeDevice &device)
{
	std::cout << device.mac << "\t" << device.address << "\t" << device.scaninfo["name"].asString()
	          << "\t" << (device.isBound() ? "bound" : "unbound") << "\n";
}


int main(int argc, char *argv[])
{
	if (argc < 2)
		usage(argv[0]);
	std::string command = argv[1];

	greeConfig config;
	if (!config.LoadFile())
	{
		// run on defaults when there is no configuration file at all
		if (config.getlasterrordetail().find("cannot open") != 0)
			return report_error(config.getlasterror(), config.getlasterrordetail());
		config = greeConfig();
	}

	greeClient client;
	if (!client.Configure(config))
		return report_error(client.getlasterror(), client.getlasterrordetail());
#ifdef DEBUG
	client.setOutput(&std::cerr);
#endif
	if (!client.Open())
		return report_error(client.getlasterror(), client.getlasterrordetail());

	if (command == "list")
	{
		if (!client.WithState([](const greeRegistry &registry) {
			const std::map<std::string, greeDevice> &devices = registry.getDevices();
			for (std::map<std::string, greeDevice>::const_iterator it = devices.begin(); it != devices.end(); ++it)
				print_device(it->second);
		}))
			return report_error(client.getlasterror(), client.getlasterrordetail());
		return 0;
	}

	if (argc < 4)
		usage(argv[0]);
	std::string target = argv[2];

	greeVarBag bag;
	if (command == "get")
	{
		std::vector<std::string> names;
		for (int i = 3; i < argc; i++)
			names.push_back(argv[i]);
		if (!bag.FromNames(names))
			return report_error(bag.getlasterror(), bag.getlasterrordetail());
		if (!client.NetRead(target, bag))
			return report_error(client.getlasterror(), client.getlasterrordetail());
	}
	else if (command == "set")
	{
		std::vector<std::pair<std::string, std::string> > pairs;
		for (int i = 3; i < argc; i++)
		{
			std::string arg = argv[i];
			size_t pos = arg.find('=');
			if (pos == std::string::npos)
				return report_error(Gree::Error::INVALID_VALUE, arg);
			pairs.push_back(std::make_pair(arg.substr(0, pos), arg.substr(pos + 1)));
		}
		if (!bag.FromNameValuePairs(pairs))
			return report_error(bag.getlasterror(), bag.getlasterrordetail());
		if (!client.NetWrite(target, bag))
			return report_error(client.getlasterror(), client.getlasterrordetail());
	}
	else
		usage(argv[0]);

	Json::StreamWriterBuilder jBuilder;
	std::cout << Json::writeString(jBuilder, bag.ToReportMap()) << "\n";
	return 0;
}
