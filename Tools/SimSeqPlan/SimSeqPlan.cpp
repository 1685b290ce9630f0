///////////////////////////////////////////////////////////////////////////////
// FILE:          SimSeqPlan.cpp
// PROJECT:       SimSeq
// SUBSYSTEM:     Tools
//-----------------------------------------------------------------------------
// DESCRIPTION:   Command line planner: loads an experiment configuration and
//                prints the resulting action table
//
// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.
//
///////////////////////////////////////////////////////////////////////////////
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "Error.h"
#include "LogManager.h"
#include "PlanConfig.h"
#include "SequencePlanner.h"
#include "TableDump.h"
#include "TimingOracle.h"

#define PLAN_VER              "1.0.0"

static void printUsage()
{
	std::cout << "simseq-plan " << PLAN_VER << std::endl << std::endl;
	std::cout << "Usage: simseq-plan <config.json> [-json] [-o <file>] [-v]" << std::endl << std::endl;
	std::cout << "  -json      Print the action table as JSON instead of text" << std::endl;
	std::cout << "  -o <file>  Write the action table to <file> instead of stdout" << std::endl;
	std::cout << "  -v         Log at debug level to stderr" << std::endl << std::endl;
	std::cout << "Image counts and experiment metadata are printed to stdout, except" << std::endl;
	std::cout << "when a JSON table is printed to stdout." << std::endl;
}

/**
 * Application entry point
 * @param argc Argument count
 * @param argv Argument list
 * @return 0 on success, 1 on a configuration or planning error, 2 on bad usage
 */
int main(int argc, char** argv)
{
	if(argc < 2)
	{
		std::cout << "Invalid arguments specified. To see program options type simseq-plan -help" << std::endl;
		return 2;
	}

	std::string carg(argv[1]);
	if(carg == "-help" || carg == "-h" || carg == "--help")
	{
		printUsage();
		return 0;
	}

	std::string configPath;
	std::string outputPath;
	bool jsonOutput = false;
	bool verbose = false;
	for(int i = 1; i < argc; i++)
	{
		carg = std::string(argv[i]);
		if(carg == "-json")
			jsonOutput = true;
		else if(carg == "-v")
			verbose = true;
		else if(carg == "-o")
		{
			if(i + 1 >= argc)
			{
				std::cout << "Option -o requires a file name. To see program options type simseq-plan -help" << std::endl;
				return 2;
			}
			outputPath = std::string(argv[++i]);
		}
		else if(!carg.empty() && carg[0] == '-')
		{
			std::cout << "Unknown option " << carg << ". To see program options type simseq-plan -help" << std::endl;
			return 2;
		}
		else if(configPath.empty())
			configPath = carg;
		else
		{
			std::cout << "Only one configuration file may be given. To see program options type simseq-plan -help" << std::endl;
			return 2;
		}
	}
	if(configPath.empty())
	{
		std::cout << "No configuration file specified. To see program options type simseq-plan -help" << std::endl;
		return 2;
	}

	try
	{
		// Until the configuration says otherwise, report problems on stderr
		simseq::LogManager logManager;
		logManager.SetPrimaryLogLevel(verbose ? simseq::logging::LogLevelDebug : simseq::logging::LogLevelWarning);
		logManager.SetUseStdErr(true);

		std::unique_ptr<simseq::PlanContext> context =
			simseq::LoadPlanConfig(configPath, logManager.NewLogger("Config"));

		const simseq::LoggingSettings& logSettings = context->loggingSettings;
		if(!verbose)
		{
			logManager.SetPrimaryLogLevel(logSettings.level);
			logManager.SetUseStdErr(logSettings.useStdErr);
		}
		if(!logSettings.filename.empty())
			logManager.SetPrimaryLogFilename(logSettings.filename, true);

		simseq::TimingOracle oracle(context->registry);
		simseq::SequencePlanner planner(context->registry, context->patternClients, oracle,
			logManager.NewLogger("Planner"), context->plannerSettings);
		simseq::ActionTable table = planner.Generate(context->plan);

		const std::string rendered = jsonOutput ?
			simseq::DumpTableJson(table, context->registry) + "\n" :
			simseq::DumpTableText(table, context->registry);

		bool printSummary = true;
		if(!outputPath.empty())
		{
			std::ofstream ofs(outputPath.c_str(), std::ios::out | std::ios::trunc);
			if(!ofs)
				throw simseq::SeqError("Cannot open file \"" + outputPath + "\"", SIMSEQERR_CannotOpenFile);
			ofs << rendered;
			if(!ofs)
				throw simseq::SeqError("Cannot write file \"" + outputPath + "\"", SIMSEQERR_CannotOpenFile);
		}
		else
		{
			std::cout << rendered;
			printSummary = !jsonOutput;
		}

		if(printSummary)
		{
			const char* prefix = outputPath.empty() ? "# " : "";
			std::cout << prefix << "Duration " << table.GetDuration().ToString() << " ms, " << table.Size() << " actions" << std::endl;
			for(simseq::ResourceHandle camera : context->plan.cameras)
			{
				std::cout << prefix << "Camera " << context->registry.GetLabel(camera) << ": "
					<< planner.GetImageCount(camera) << " images";
				if(planner.GetDiscardedImageCount(camera) > 0)
					std::cout << ", " << planner.GetDiscardedImageCount(camera) << " discarded";
				std::cout << std::endl;
			}
			if(!planner.GetExperimentMetadata().empty())
				std::cout << prefix << "Metadata " << planner.GetExperimentMetadata() << std::endl;
		}
	}
	catch(simseq::SeqError& e)
	{
		std::cerr << "Error: " << e.GetFullMsg() << std::endl;
		return 1;
	}
	catch(std::exception& e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
