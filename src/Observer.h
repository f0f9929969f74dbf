#pragma once

#include <stddef.h>

template <class T> class Observable;

/**
 * An observer which can be mixed in as a baseclass.  Implement onNotify as a method in your class.
 *
 * An observer watches at most one observable at a time; observing a new one detaches it from the old one.
 */
template <class T> class Observer
{
    Observable<T> *observed = NULL;

  public:
    virtual ~Observer();

    /// Stop watching the observable
    void unobserve();

    /// Start watching a specified observable
    void observe(Observable<T> *o);


  private:
    friend class Observable<T>;

  protected:
    /**
     * returns 0 if the notification was consumed
     * returns !0 to report a failure back to the caller of notifyObservers
     **/
    virtual int onNotify(T arg) = 0;
};

/**
 * An observable with a single consumer slot.  The data path of a transfer has exactly one owner at every stage (a
 * completed super-chunk belongs to the download session, a fresh frame stream to the transport), so notifications are a
 * one-shot hand over rather than a fan out.
 *
 * Argument type T should be a pointer or word sized object: a completed super-chunk is handed out as a pointer to the
 * buffer, which stays valid only for the duration of the notification.
 */
template <class T> class Observable
{
    Observer<T> *observer = NULL;

  public:
    ~Observable()
    {
        if (observer)
            observer->observed = NULL;
    }

    /**
     * Hand arg to the registered observer
     *
     * returns the observer's result, or 0 if nobody is listening
     */
    int notifyObservers(T arg)
    {
        if (!observer)
            return 0;

        return observer->onNotify(arg);
    }


  private:
    friend class Observer<T>;

    // Not called directly, instead call observer.observe
    void setObserver(Observer<T> *o)
    {
        if (observer && observer != o)
            observer->observed = NULL;
        observer = o;
    }

    void removeObserver(Observer<T> *o)
    {
        if (observer == o)
            observer = NULL;
    }
};

template <class T> Observer<T>::~Observer()
{
    unobserve();
}

template <class T> void Observer<T>::unobserve()
{
    if (observed)
        observed->removeObserver(this);
    observed = NULL;
}

template <class T> void Observer<T>::observe(Observable<T> *o)
{
    unobserve();
    observed = o;
    o->setObserver(this);
}
