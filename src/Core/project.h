/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file project.h
//! \brief Describes the Project class.

#ifndef PROJECT_H_
#define PROJECT_H_

#include "Core/network.h"
#include "Core/hydengine.h"
#include "Output/hydresults.h"

#include <string>
#include <ostream>

namespace Wnsim
{
	//!
	//! \class Project
	//! \brief Encapsulates a pipe network and its hydraulic engine.
	//!
	//! A project holds the network being analyzed, the engine that simulates
	//! its hydraulics and the results it produces. Its public methods never
	//! throw: each returns 0 on success or the code of the error that stopped
	//! it, after writing the error's message to the network's message log.

	class Project
	{
	  public:

		Project();
		~Project();

		Network* getNetwork() { return &network; }
		const HydResults& getResults() const { return results; }

		int  initSolver();
		int  runSolver(int* t);
		int  advanceSolver(int* tstep);
		int  runSimulation();
		int  runHorizon();
		void finalizeSolver();

		void writeSummary(std::ostream& out);
		void writeMsg(const std::string& msg);
		void writeMsgLog(std::ostream& out);
		void clear();

	  private:

		Network    network;             //!< pipe network to be analyzed
		HydEngine  hydEngine;           //!< hydraulic simulation engine
		HydResults results;             //!< solved heads and flows

		bool hydEngineOpened;           //!< hydraulic engine opened flag
		bool solverInitialized;         //!< solver initialized flag
	};
}

#endif
