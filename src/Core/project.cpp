/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 ////////////////////////////////////////////
 //  Implementation of the Project class.  //
 ////////////////////////////////////////////

#include "project.h"
#include "Core/error.h"
#include "Elements/node.h"
#include "Elements/link.h"

using namespace std;

namespace Wnsim
{
	//  Constructor

	Project::Project() :
		hydEngineOpened(false),
		solverInitialized(false)
	{
	}

	//  Destructor

	Project::~Project()
	{
		hydEngine.close();
	}

	//-----------------------------------------------------------------------------

	//  Clear the project of all data.

	void Project::clear()
	{
		hydEngine.close();
		hydEngineOpened = false;
		solverInitialized = false;
		results.clear();
		network.clear();
	}

	//-----------------------------------------------------------------------------

	//  Initialize the project's hydraulic engine.

	int Project::initSolver()
	{
		try
		{
			solverInitialized = false;
			if ( network.nodes.empty() ) throw SystemError(SystemError::NO_NETWORK_DATA);

			// ... open & initialize the hydraulic engine
			if ( !hydEngineOpened )
			{
				hydEngine.open(&network);
				hydEngineOpened = true;
			}
			hydEngine.init(&results);

			// ... mark solver as being initialized
			solverInitialized = true;
			return 0;
		}
		catch (ENerror const& e)
		{
			writeMsg(e.msg);
			return e.code;
		}
	}

	//-----------------------------------------------------------------------------

	//  Solve network hydraulics at the current point in time.

	int Project::runSolver(int* t)
	{
		try
		{
			if ( !solverInitialized ) throw SystemError(SystemError::SOLVER_NOT_INITIALIZED);
			hydEngine.solve(t);
			return 0;
		}
		catch (ENerror const& e)
		{
			writeMsg(e.msg);
			return e.code;
		}
	}

	//-----------------------------------------------------------------------------

	//  Record the current solution and advance to the next point in time.

	int Project::advanceSolver(int* tstep)
	{
		try
		{
			*tstep = 0;
			if ( !solverInitialized ) throw SystemError(SystemError::SOLVER_NOT_INITIALIZED);
			hydEngine.advance(tstep);
			if ( *tstep == 0 ) finalizeSolver();
			return 0;
		}
		catch (ENerror const& e)
		{
			writeMsg(e.msg);
			return e.code;
		}
	}

	//-----------------------------------------------------------------------------

	//  Run a time stepped simulation over the full duration.

	int Project::runSimulation()
	{
		int errcode = initSolver();
		int t = 0;
		int tstep = 0;
		while ( errcode == 0 )
		{
			errcode = runSolver(&t);
			if ( errcode ) break;
			errcode = advanceSolver(&tstep);
			if ( tstep == 0 ) break;
		}
		if ( errcode ) finalizeSolver();
		return errcode;
	}

	//-----------------------------------------------------------------------------

	//  Solve all time periods as a single system of equations.

	int Project::runHorizon()
	{
		int errcode = initSolver();
		if ( errcode ) return errcode;
		try
		{
			hydEngine.runHorizon();
			finalizeSolver();
			return 0;
		}
		catch (ENerror const& e)
		{
			finalizeSolver();
			writeMsg(e.msg);
			return e.code;
		}
	}

	//-----------------------------------------------------------------------------

	//  Mark the end of a run. Results remain available.

	void Project::finalizeSolver()
	{
		solverInitialized = false;
	}

	//-----------------------------------------------------------------------------

	//  Write a message to the project's message log.

	void Project::writeMsg(const std::string& msg)
	{
		network.msgLog << "\n" << msg;
	}

	//-----------------------------------------------------------------------------

	//  Write a summary of the network and its analysis options.

	void Project::writeSummary(ostream& out)
	{
		int nJunctions = 0, nTanks = 0, nReservoirs = 0;
		for (Node* node : network.nodes)
		{
			if ( node->type == Node::JUNCTION ) nJunctions++;
			else if ( node->type == Node::TANK ) nTanks++;
			else nReservoirs++;
		}
		int nPipes = 0, nPumps = 0, nValves = 0;
		for (Link* link : network.links)
		{
			if ( link->type == Link::PIPE ) nPipes++;
			else if ( link->type == Link::PUMP ) nPumps++;
			else nValves++;
		}

		out << "\n  Network Summary";
		out << "\n  ---------------";
		out << "\n  Number of Junctions ...... " << nJunctions;
		out << "\n  Number of Tanks .......... " << nTanks;
		out << "\n  Number of Reservoirs ..... " << nReservoirs;
		out << "\n  Number of Pipes .......... " << nPipes;
		out << "\n  Number of Pumps .......... " << nPumps;
		out << "\n  Number of Valves ......... " << nValves;
		out << "\n";
		out << network.options.hydOptionsToStr();
		out << network.options.timeOptionsToStr();
	}

	//-----------------------------------------------------------------------------

	//  Write the project's message log to an output stream.

	void Project::writeMsgLog(ostream& out)
	{
		out << network.msgLog.str();
		network.msgLog.str("");
	}
}
