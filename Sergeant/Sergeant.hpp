/* 
 * This file is part of the snippetspp distribution (https://github.com/Warpten/snippetspp).
 * Copyright (c) 2021 Warpten.
 * 
 * This program is free software: you can redistribute it and/or modify  
 * it under the terms of the GNU General Public License as published by  
 * the Free Software Foundation, version 3.
 *
 * This program is distributed in the hope that it will be useful, but 
 * WITHOUT ANY WARRANTY; without even the implied warranty of 
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU 
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License 
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SERGEANT_HEADER_GUARD_HPP__
#define SERGEANT_HEADER_GUARD_HPP__

#include "Config.hpp"
#include "StringRange.hpp"
#include "Exceptions.hpp"
#include "StringReader.hpp"
#include "Suggestions.hpp"
#include "ArgumentTypes.hpp"
#include "Context.hpp"
#include "CommandNode.hpp"
#include "Builder.hpp"
#include "Dispatcher.hpp"

#endif // SERGEANT_HEADER_GUARD_HPP__
