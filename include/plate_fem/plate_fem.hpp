#pragma once

#include "assembler.hpp"
#include "boundary.hpp"
#include "dof.hpp"
#include "element.hpp"
#include "errors.hpp"
#include "material.hpp"
#include "mesh.hpp"
#include "mesh_builder.hpp"
#include "postprocess.hpp"
#include "problem.hpp"
#include "solver.hpp"
#include "visualization.hpp"
#include "vtk_writer.hpp"

/*
 * PlateFEM – A lightweight, header-only plane elasticity solver.
 *
 * Features:
 *  - Linear (constant strain) triangles under plane stress or plane strain.
 *  - Boundary conditions stored per degree of freedom as tagged known/unknown
 *    values and validated before assembly.
 *  - Dense (explicit inverse, Gaussian elimination) and sparse (preconditioned
 *    conjugate gradient) solution of the partitioned system, with reaction
 *    recovery at the supports.
 *  - Element strain, stress and von Mises post-processing, colour mapping and a
 *    plotting-agnostic scene description, plus VTK XML export.
 *  - C++23 interface on standard containers; console output goes through the
 *    shared safe_io printing utilities built on {fmt}.
 */
