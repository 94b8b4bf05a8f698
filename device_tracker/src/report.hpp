#ifndef REPORT_HPP
#define REPORT_HPP

#include "device.hpp"
#include "reconciler.hpp"
#include <string>

/* "<name> (last: <time>) is at (IP: <ip>, MAC: <mac>)" */
std::string favourite_to_string(const FavouriteRecord &f);

/* One line describing the outcome of a favourite during a pass */
std::string event_to_string(const ReconcileEvent &e);

std::string html_escape(const std::string &s);

#endif
