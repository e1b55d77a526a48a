//    --------------------------------------------------------------------
//
//    This file is part of rerp.
//
//    rerp is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    rerp is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with rerp. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "rerp/pool.h"

#include <memory>
#include <stdexcept>


pool_t::pool_t( int nthreads )
  : stopping( false )
{
  int n = nthreads > 0 ? nthreads : (int)std::thread::hardware_concurrency();
  if ( n < 1 ) n = 1;

  workers.reserve( n );
  for (int i=0; i<n; i++)
    workers.push_back( std::thread( &pool_t::worker , this ) );
}

pool_t::~pool_t()
{
  shutdown();
}

std::future<void> pool_t::enqueue( std::function<void()> task )
{
  std::shared_ptr<std::packaged_task<void()> > pt = std::make_shared<std::packaged_task<void()> >( task );
  std::future<void> f = pt->get_future();

  {
    std::lock_guard<std::mutex> lock( mtx );
    if ( stopping ) throw std::runtime_error( "task submitted to a stopped pool" );
    tasks.push_back( [pt]() { (*pt)(); } );
  }

  cv.notify_one();
  return f;
}

void pool_t::shutdown()
{
  {
    std::lock_guard<std::mutex> lock( mtx );
    if ( stopping ) return;
    stopping = true;
  }

  cv.notify_all();

  for (int i=0; i<workers.size(); i++)
    if ( workers[i].joinable() ) workers[i].join();
}

void pool_t::worker()
{
  for (;;)
    {
      std::function<void()> task;

      {
	std::unique_lock<std::mutex> lock( mtx );
	cv.wait( lock , [this] { return stopping || ! tasks.empty(); } );

	// stop only once the queue is drained
	if ( tasks.empty() ) return;

	task = std::move( tasks.front() );
	tasks.pop_front();
      }

      task();
    }
}
