/***************************************************************************
 *   Copyright (C) 2021-2023 Mindaugas Margelevicius                       *
 *   Institute of Biotechnology, Vilnius University                        *
 ***************************************************************************/

#ifndef __mptimer_h__
#define __mptimer_h__

#include <ratio>
#include <chrono>

////////////////////////////////////////////////////////////////////////////
// CLASS MyMpTimer for measuring wall-clock time of processes and batches
//
template<class Period = std::ratio<1>>
class MyMpTimer {
public:
    explicit MyMpTimer(bool start = false): elapsed_(0) {
        if(start) Start();
    }

    //start measuring time
    void Start() {
        start_ = std::chrono::steady_clock::now();
    }

    //stop the timer; measure the elapsed time
    void Stop() {
        stop_ = std::chrono::steady_clock::now();
        elapsed_ = stop_- start_;
    }

    //time between the last Start() and Stop()
    double GetElapsedTime() const {return elapsed_.count();}

private:
    std::chrono::time_point<std::chrono::steady_clock> start_, stop_;
    std::chrono::duration<double, Period> elapsed_;
};

#endif//__mptimer_h__
