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

#ifndef __RERP_POOL_H__
#define __RERP_POOL_H__

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

// fixed-size worker pool; tasks are pulled from a shared FIFO queue

class pool_t {

 public:

  // 0 means std::thread::hardware_concurrency()
  explicit pool_t( int nthreads = 0 );

  // drains queued tasks and joins the workers
  ~pool_t();

  // exceptions thrown by the task are stored in the future
  std::future<void> enqueue( std::function<void()> task );

  void shutdown();

  int size() const { return workers.size(); }

 private:

  pool_t( const pool_t & );
  pool_t & operator=( const pool_t & );

  void worker();

  std::vector<std::thread> workers;

  std::deque<std::function<void()> > tasks;

  std::mutex mtx;

  std::condition_variable cv;

  std::atomic<bool> stopping;

};

#endif
