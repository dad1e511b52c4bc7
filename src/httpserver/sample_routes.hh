/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SAMPLE_ROUTES_HH
#define SAMPLE_ROUTES_HH

#include "http_router.hh"

/* GET /, /sample, /schools/:id/classes and /schools/:id/:score/classes/:disco
   answer with their bound parameters as a JSON object; POST /echo parses
   the body as JSON and sends it back reformatted (400 if it won't parse) */
void add_sample_routes( HTTPRouter & router );

#endif /* SAMPLE_ROUTES_HH */
